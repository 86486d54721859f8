// Local live transcription of a raw PCM stream (stdin or pipe)
//
// Audio is recorded to a WAV file while whisper transcribes it; the running
// transcript is cut into segments, and once the input ends (or on Ctrl+C)
// the session is finalized with chapters and, optionally, speakers.
//
#include "classnote/audio-source.h"
#include "classnote/chapter-api.h"
#include "classnote/diarization.h"
#include "classnote/log.h"
#include "classnote/session-finalizer.h"
#include "classnote/session-store.h"
#include "classnote/transcription-engine.h"
#include "classnote/whisper-recognizer.h"

#include "ggml-backend.h"
#include "whisper.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

// command-line parameters
struct live_params {
    classnote::whisper_recognizer_params whisper;
    classnote::segmenter_params          segmenter;

    std::string input       = "-"; // "-" = stdin
    std::string format      = "s16"; // f32 or s16
    int32_t     sample_rate = WHISPER_SAMPLE_RATE;
    bool        realtime    = false;

    std::string audio_path  = "recording.wav";
    std::string session_id;
    std::string mode        = "lecture";

    std::string diarization; // speaker intervals exported as JSON
    std::string backend;     // backend base URL for chapter generation
    std::string token;
    std::string cache_dir   = ".";

    bool merge_chapters = false;
    bool verbose        = false;
};

void live_print_usage(int argc, char ** argv, const live_params & params);

static bool live_params_parse(int argc, char ** argv, live_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            live_print_usage(argc, argv, params);
            exit(0);
        }

        if      (arg == "-t"    || arg == "--threads")         { params.whisper.n_threads  = std::stoi(argv[++i]); }
        else if (                  arg == "--step")            { params.whisper.step_ms    = std::stoi(argv[++i]); }
        else if (                  arg == "--length")          { params.whisper.length_ms  = std::stoi(argv[++i]); }
        else if (arg == "-mt"   || arg == "--max-tokens")      { params.whisper.max_tokens = std::stoi(argv[++i]); }
        else if (arg == "-ac"   || arg == "--audio-ctx")       { params.whisper.audio_ctx  = std::stoi(argv[++i]); }
        else if (arg == "-bs"   || arg == "--beam-size")       { params.whisper.beam_size  = std::stoi(argv[++i]); }
        else if (arg == "-tr"   || arg == "--translate")       { params.whisper.translate  = true; }
        else if (arg == "-nf"   || arg == "--no-fallback")     { params.whisper.no_fallback = true; }
        else if (arg == "-ng"   || arg == "--no-gpu")          { params.whisper.use_gpu    = false; }
        else if (arg == "-fa"   || arg == "--flash-attn")      { params.whisper.flash_attn = true; }
        else if (arg == "-l"    || arg == "--language")        { params.whisper.language   = argv[++i]; }
        else if (arg == "-m"    || arg == "--model")           { params.whisper.model      = argv[++i]; }
        else if (                  arg == "--max-chars")       { params.segmenter.max_chars       = std::stoi(argv[++i]); }
        else if (                  arg == "--min-split-chars") { params.segmenter.min_split_chars = std::stoi(argv[++i]); }
        else if (                  arg == "--max-seconds")     { params.segmenter.max_seconds     = std::stod(argv[++i]); }
        else if (arg == "-i"    || arg == "--input")           { params.input       = argv[++i]; }
        else if (                  arg == "--format")          { params.format      = argv[++i]; }
        else if (                  arg == "--sample-rate")     { params.sample_rate = std::stoi(argv[++i]); }
        else if (                  arg == "--realtime")        { params.realtime    = true; }
        else if (arg == "-o"    || arg == "--audio")           { params.audio_path  = argv[++i]; }
        else if (arg == "-s"    || arg == "--session")         { params.session_id  = argv[++i]; }
        else if (                  arg == "--mode")            { params.mode        = argv[++i]; }
        else if (arg == "-d"    || arg == "--diarization")     { params.diarization = argv[++i]; }
        else if (                  arg == "--backend")         { params.backend     = argv[++i]; }
        else if (                  arg == "--token")           { params.token       = argv[++i]; }
        else if (                  arg == "--cache-dir")       { params.cache_dir   = argv[++i]; }
        else if (                  arg == "--merge-chapters")  { params.merge_chapters = true; }
        else if (arg == "-v"    || arg == "--verbose")         { params.verbose     = true; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            live_print_usage(argc, argv, params);
            return false;
        }
    }

    return true;
}

void live_print_usage(int /*argc*/, char ** argv, const live_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,       --help              [default] show this help message and exit\n");
    fprintf(stderr, "  -t N,     --threads N         [%-7d] number of threads to use during computation\n",    params.whisper.n_threads);
    fprintf(stderr, "            --step N            [%-7d] audio step size in milliseconds\n",                params.whisper.step_ms);
    fprintf(stderr, "            --length N          [%-7d] audio length in milliseconds\n",                   params.whisper.length_ms);
    fprintf(stderr, "  -mt N,    --max-tokens N      [%-7d] maximum number of tokens per audio chunk\n",       params.whisper.max_tokens);
    fprintf(stderr, "  -ac N,    --audio-ctx N       [%-7d] audio context size (0 - all)\n",                   params.whisper.audio_ctx);
    fprintf(stderr, "  -bs N,    --beam-size N       [%-7d] beam size for beam search\n",                      params.whisper.beam_size);
    fprintf(stderr, "  -tr,      --translate         [%-7s] translate from source language to english\n",      params.whisper.translate ? "true" : "false");
    fprintf(stderr, "  -nf,      --no-fallback       [%-7s] do not use temperature fallback while decoding\n", params.whisper.no_fallback ? "true" : "false");
    fprintf(stderr, "  -ng,      --no-gpu            [%-7s] disable GPU inference\n",                          params.whisper.use_gpu ? "false" : "true");
    fprintf(stderr, "  -fa,      --flash-attn        [%-7s] enable flash attention during inference\n",        params.whisper.flash_attn ? "true" : "false");
    fprintf(stderr, "  -l LANG,  --language LANG     [%-7s] spoken language\n",                                params.whisper.language.c_str());
    fprintf(stderr, "  -m FNAME, --model FNAME       [%-7s] model path\n",                                     params.whisper.model.c_str());
    fprintf(stderr, "            --max-chars N       [%-7d] close a segment at this many characters\n",        params.segmenter.max_chars);
    fprintf(stderr, "            --min-split-chars N [%-7d] never split a segment shorter than this\n",        params.segmenter.min_split_chars);
    fprintf(stderr, "            --max-seconds N     [%-7.1f] close a segment after this many seconds\n",      params.segmenter.max_seconds);
    fprintf(stderr, "  -i PATH,  --input PATH        [%-7s] input path ('-' for stdin)\n",                     params.input.c_str());
    fprintf(stderr, "            --format FMT        [%-7s] input format: f32 or s16 (little-endian)\n",      params.format.c_str());
    fprintf(stderr, "            --sample-rate N     [%-7d] input sample rate (must be 16000)\n",             params.sample_rate);
    fprintf(stderr, "            --realtime          [%-7s] pace file input at its sample rate\n",             params.realtime ? "true" : "false");
    fprintf(stderr, "  -o FNAME, --audio FNAME       [%-7s] recorded audio (WAV)\n",                           params.audio_path.c_str());
    fprintf(stderr, "  -s ID,    --session ID        [%-7s] session id (enables the cache and the backend)\n", params.session_id.c_str());
    fprintf(stderr, "            --mode MODE         [%-7s] lecture or meeting\n",                             params.mode.c_str());
    fprintf(stderr, "  -d FNAME, --diarization FNAME [%-7s] speaker intervals (JSON)\n",                       params.diarization.c_str());
    fprintf(stderr, "            --backend URL       [%-7s] backend base URL for chapter generation\n",        params.backend.c_str());
    fprintf(stderr, "            --token TOKEN       [%-7s] backend bearer token\n",                           params.token.empty() ? "" : "***");
    fprintf(stderr, "            --cache-dir DIR     [%-7s] directory for segment and chapter caches\n",       params.cache_dir.c_str());
    fprintf(stderr, "            --merge-chapters    [%-7s] merge short segments into longer chapters\n",      params.merge_chapters ? "true" : "false");
    fprintf(stderr, "  -v,       --verbose           [%-7s] debug logging\n",                                  params.verbose ? "true" : "false");
    fprintf(stderr, "\n");
}

// 65.5 -> 01:05.500
static std::string to_timestamp(double t) {
    const int64_t msec = (int64_t) (t*1000.0 + 0.5);
    const int64_t min  = msec/60000;
    const int64_t sec  = (msec/1000)%60;

    char buf[32];
    snprintf(buf, sizeof(buf), "%02d:%02d.%03d", (int) min, (int) sec, (int) (msec%1000));

    return std::string(buf);
}

static std::atomic_bool g_running(true);

static void signal_handler(int) {
    g_running = false;
}

int main(int argc, char ** argv) {
    ggml_backend_load_all();

    live_params params;

    if (live_params_parse(argc, argv, params) == false) {
        return 1;
    }

    if (params.verbose) {
        classnote_log_set_level(CLASSNOTE_LOG_LEVEL_DEBUG);
    }

    if (params.sample_rate != WHISPER_SAMPLE_RATE) {
        fprintf(stderr, "error: only --sample-rate %d is supported (got %d). resample before streaming.\n",
                WHISPER_SAMPLE_RATE, params.sample_rate);
        return 1;
    }

    classnote::pcm_source_params pcm;
    pcm.input       = params.input;
    pcm.sample_rate = params.sample_rate;
    pcm.realtime    = params.realtime;
    if (!classnote::pcm_format_parse(params.format, pcm.format)) {
        fprintf(stderr, "error: unknown --format '%s' (expected f32 or s16)\n", params.format.c_str());
        return 1;
    }

    classnote::session_mode mode = classnote::session_mode::lecture;
    if (!classnote::session_mode_parse(params.mode, mode)) {
        fprintf(stderr, "error: unknown --mode '%s' (expected lecture or meeting)\n", params.mode.c_str());
        return 1;
    }

    std::unique_ptr<classnote::WhisperRecognizer> recognizer;
    try {
        recognizer.reset(new classnote::WhisperRecognizer(params.whisper));
    } catch (const std::exception & e) {
        fprintf(stderr, "error: %s\n", e.what());
        return 2;
    }

    classnote::PcmFileSource source(pcm);

    classnote::engine_params eparams;
    eparams.segmenter  = params.segmenter;
    eparams.audio_path = params.audio_path;

    classnote::TranscriptionEngine engine(*recognizer, source, eparams);

    engine.on_partial([](const std::string & /*text*/, const std::string & delta) {
        printf("%s", delta.c_str());
        fflush(stdout);
    });

    engine.on_segment([](const classnote::transcript_segment & segment, bool is_final) {
        printf("\n[%s --> %s] #%d%s\n", to_timestamp(segment.start_time).c_str(), to_timestamp(segment.end_time).c_str(),
                segment.index, is_final ? " (final)" : "");
        fflush(stdout);
    });

    std::signal(SIGINT, signal_handler);

    if (!engine.start()) {
        fprintf(stderr, "error: %s\n", engine.last_error().c_str());
        return 3;
    }

    fprintf(stderr, "%s: recording to '%s', press Ctrl+C to stop\n", __func__, engine.audio_path().c_str());

    while (g_running && !engine.wait_stopped(100)) {
        // wait for the end of input or Ctrl+C
    }

    engine.stop();

    if (!engine.last_error().empty()) {
        fprintf(stderr, "%s: recording ended with an error: %s\n", __func__, engine.last_error().c_str());
    }

    const auto segments = engine.segments();

    // post-processing
    std::unique_ptr<classnote::Diarizer> diarizer;
    if (!params.diarization.empty()) {
        diarizer.reset(new classnote::JsonDiarizer(params.diarization));
    }

    std::unique_ptr<classnote::ChapterSource> chapter_source;
    if (!params.backend.empty()) {
        classnote::chapter_api_params aparams;
        aparams.base_url = params.backend;
        aparams.token    = params.token;
        chapter_source.reset(new classnote::ChapterApi(aparams));
    }

    classnote::SessionStore store(params.cache_dir);

    classnote::finalize_params fparams;
    fparams.session_id     = params.session_id;
    fparams.audio_path     = engine.audio_path();
    fparams.mode           = mode;
    fparams.merge_chapters = params.merge_chapters;

    const auto transcript = classnote::finalize_session(segments, fparams, diarizer.get(), chapter_source.get(), &store);

    printf("\n");
    printf("chapters:\n");
    for (const auto & chapter : transcript.chapters) {
        printf("  %s  %s\n", to_timestamp(chapter.time_seconds).c_str(), chapter.title.c_str());
    }

    printf("\n");
    printf("transcript:\n");
    for (const auto & segment : transcript.segments) {
        printf("[%s --> %s]%s%s  %s\n",
                to_timestamp(segment.start_time).c_str(), to_timestamp(segment.end_time).c_str(),
                segment.speaker ? " " : "", segment.speaker_label.c_str(), segment.text.c_str());
    }

    return engine.last_error().empty() ? 0 : 4;
}
