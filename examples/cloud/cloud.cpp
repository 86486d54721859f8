// Cloud live transcription: streams raw PCM (stdin or pipe) to the backend's
// realtime endpoint and prints the captions it sends back.
//
#include "classnote/audio-source.h"
#include "classnote/live-lines.h"
#include "classnote/log.h"
#include "classnote/realtime-client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <mutex>
#include <string>

// command-line parameters
struct cloud_params {
    std::string backend = "http://localhost:8080";
    std::string session_id;
    std::string token;

    classnote::realtime_config config;

    std::string input     = "-"; // "-" = stdin
    std::string format    = "s16"; // f32 or s16
    int32_t     chunk_ms  = 100;
    bool        realtime  = false;
    int32_t     drain_ms  = 3000;  // wait for the last results after the stop frame

    bool verbose = false;
};

void cloud_print_usage(int argc, char ** argv, const cloud_params & params);

static bool cloud_params_parse(int argc, char ** argv, cloud_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cloud_print_usage(argc, argv, params);
            exit(0);
        }
        else if (arg == "-b"  || arg == "--backend")          { params.backend    = argv[++i]; }
        else if (arg == "-s"  || arg == "--session")          { params.session_id = argv[++i]; }
        else if (                arg == "--token")            { params.token      = argv[++i]; }
        else if (arg == "-l"  || arg == "--language")         { params.config.language_code     = argv[++i]; }
        else if (                arg == "--sample-rate")      { params.config.sample_rate_hertz = std::stoi(argv[++i]); }
        else if (                arg == "--speakers")         { params.config.speaker_count     = std::stoi(argv[++i]); }
        else if (                arg == "--no-diarization")   { params.config.enable_speaker_diarization = false; }
        else if (arg == "-m"  || arg == "--model")            { params.config.model = argv[++i]; }
        else if (arg == "-i"  || arg == "--input")            { params.input    = argv[++i]; }
        else if (                arg == "--format")           { params.format   = argv[++i]; }
        else if (                arg == "--chunk")            { params.chunk_ms = std::stoi(argv[++i]); }
        else if (                arg == "--realtime")         { params.realtime = true; }
        else if (                arg == "--drain")            { params.drain_ms = std::stoi(argv[++i]); }
        else if (arg == "-v"  || arg == "--verbose")          { params.verbose  = true; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            cloud_print_usage(argc, argv, params);
            return false;
        }
    }

    if (params.session_id.empty()) {
        fprintf(stderr, "error: --session is required\n");
        return false;
    }

    return true;
}

void cloud_print_usage(int /*argc*/, char ** argv, const cloud_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s --session ID [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,       --help           [default] show this help message and exit\n");
    fprintf(stderr, "  -b URL,   --backend URL    [%-7s] backend base URL (https uses wss)\n",          params.backend.c_str());
    fprintf(stderr, "  -s ID,    --session ID     [%-7s] session id\n",                                 params.session_id.c_str());
    fprintf(stderr, "            --token TOKEN    [%-7s] bearer token\n",                               params.token.empty() ? "" : "***");
    fprintf(stderr, "  -l LANG,  --language LANG  [%-7s] language code\n",                              params.config.language_code.c_str());
    fprintf(stderr, "            --sample-rate N  [%-7d] input sample rate\n",                          params.config.sample_rate_hertz);
    fprintf(stderr, "            --speakers N     [%-7d] expected number of speakers\n",                params.config.speaker_count);
    fprintf(stderr, "            --no-diarization [%-7s] disable speaker diarization\n",                params.config.enable_speaker_diarization ? "false" : "true");
    fprintf(stderr, "  -m NAME,  --model NAME     [%-7s] recognition model\n",                          params.config.model.c_str());
    fprintf(stderr, "  -i PATH,  --input PATH     [%-7s] input path ('-' for stdin)\n",                 params.input.c_str());
    fprintf(stderr, "            --format FMT     [%-7s] input format: f32 or s16 (little-endian)\n",  params.format.c_str());
    fprintf(stderr, "            --chunk N        [%-7d] audio frame length in milliseconds\n",         params.chunk_ms);
    fprintf(stderr, "            --realtime       [%-7s] pace file input at its sample rate\n",         params.realtime ? "true" : "false");
    fprintf(stderr, "            --drain N        [%-7d] ms to wait for results after the stop frame\n", params.drain_ms);
    fprintf(stderr, "  -v,       --verbose        [%-7s] debug logging\n",                              params.verbose ? "true" : "false");
    fprintf(stderr, "\n");
}

static std::atomic_bool g_running(true);

static void signal_handler(int) {
    g_running = false;
}

int main(int argc, char ** argv) {
    cloud_params params;

    if (cloud_params_parse(argc, argv, params) == false) {
        return 1;
    }

    if (params.verbose) {
        classnote_log_set_level(CLASSNOTE_LOG_LEVEL_DEBUG);
    }

    classnote::pcm_source_params pcm;
    pcm.input       = params.input;
    pcm.sample_rate = params.config.sample_rate_hertz;
    pcm.chunk_ms    = params.chunk_ms;
    pcm.realtime    = params.realtime;
    if (!classnote::pcm_format_parse(params.format, pcm.format)) {
        fprintf(stderr, "error: unknown --format '%s' (expected f32 or s16)\n", params.format.c_str());
        return 1;
    }

    classnote::realtime_client_params rparams;
    rparams.base_url   = params.backend;
    rparams.session_id = params.session_id;
    rparams.token      = params.token;
    rparams.config     = params.config;

    classnote::RealtimeClient client(rparams);
    classnote::LiveLines      lines;

    std::mutex              mutex;
    std::condition_variable cv;
    bool input_done = false;
    bool closed     = false;

    client.on_event([&](const classnote::realtime_event & event) {
        if (lines.apply(event)) {
            const auto & line = lines.lines().back();
            printf("\33[2K\r%s: %s\n", classnote::speaker_label(line.speaker).c_str(), line.text.c_str());
        } else {
            printf("\33[2K\r%s", lines.current().c_str());
        }
        fflush(stdout);
    });

    client.on_closed([&](const std::string & error) {
        if (!error.empty()) {
            fprintf(stderr, "\n%s: connection lost: %s\n", __func__, error.c_str());
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    });

    if (!client.connect()) {
        fprintf(stderr, "error: failed to connect: %s\n", client.last_error().c_str());
        return 2;
    }

    classnote::PcmFileSource source(pcm);

    classnote::audio_callbacks callbacks;
    callbacks.on_samples = [&](const float * samples, size_t n_samples) {
        client.send_audio(samples, n_samples);
    };
    callbacks.on_end = [&](const std::string & error) {
        if (!error.empty()) {
            fprintf(stderr, "\n%s: audio input failed: %s\n", __func__, error.c_str());
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            input_done = true;
        }
        cv.notify_all();
    };

    std::signal(SIGINT, signal_handler);

    std::string error;
    if (!source.start(callbacks, error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        client.disconnect();
        return 3;
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        while (g_running && !input_done && !closed) {
            cv.wait_for(lock, std::chrono::milliseconds(100));
        }
    }

    source.stop();
    client.send_stop();

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, std::chrono::milliseconds(params.drain_ms), [&]{ return closed; });
    }

    client.disconnect();

    printf("\n");
    printf("transcript:\n");
    for (const auto & line : lines.lines()) {
        printf("%s: %s\n", classnote::speaker_label(line.speaker).c_str(), line.text.c_str());
    }

    return client.last_error().empty() ? 0 : 4;
}
