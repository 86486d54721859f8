#include "classnote/chapters.h"

#include <cstdio>
#include <string>
#include <vector>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace classnote;

static transcript_segment make_segment(int32_t index, double start, double end, const std::string & text) {
    transcript_segment segment;
    segment.index      = index;
    segment.start_time = start;
    segment.end_time   = end;
    segment.text       = text;
    return segment;
}

void test_title() {
    assert(chapter_title("Hello, today we discuss AI.", session_mode::lecture) == "Hello");
    assert(chapter_title("  Short title  ", session_mode::lecture) == "Short title");
    assert(chapter_title("What is entropy? It is...", session_mode::lecture) == "What is entropy");
    assert(chapter_title("今日は機械学習の話をします。次に", session_mode::lecture) == "今日は機械学習の話をします");
    assert(chapter_title("はい、それでは", session_mode::meeting) == "はい");

    // truncated at 20 code points
    assert(chapter_title("abcdefghijklmnopqrstuvwxyz", session_mode::lecture) == "abcdefghijklmnopqrst...");
    assert(chapter_title("あいうえおかきくけこさしすせそたちつてとなにぬねの", session_mode::lecture) ==
           "あいうえおかきくけこさしすせそたちつてと...");
    assert(chapter_title("abcdefghijklmnopqrst", session_mode::lecture) == "abcdefghijklmnopqrst");

    // nothing usable
    assert(chapter_title("", session_mode::lecture) == "lecture content");
    assert(chapter_title("   ", session_mode::meeting) == "meeting content");
    assert(chapter_title("。続き", session_mode::meeting) == "meeting content");
}

void test_chapters_from_segments() {
    const std::vector<transcript_segment> segments = {
        make_segment(0,  0.0,  40.0, "Introduction. Welcome"),
        make_segment(1, 40.0, 100.0, "Second part"),
    };

    const auto chapters = chapters_from_segments(segments, session_mode::lecture);
    assert(chapters.size() == 2);
    assert(chapters[0].id == "ch-0");
    assert(chapters[0].time_seconds == 0.0);
    assert(chapters[0].title == "Introduction");
    assert(chapters[1].id == "ch-1");
    assert(chapters[1].time_seconds == 40.0);
    assert(chapters[1].title == "Second part");

    assert(chapters_from_segments({}, session_mode::lecture).empty());
}

void test_merge_example() {
    const std::vector<transcript_segment> segments = {
        make_segment(0,  0.0, 10.0, "first short"),
        make_segment(1, 10.0, 25.0, "second short"),
        make_segment(2, 25.0, 95.0, "a long one"),
    };

    const auto chapters = merge_into_chapters(segments, 60.0);
    assert(chapters.size() == 2);

    assert(chapters[0].id == "merged-0");
    assert(chapters[0].time_seconds == 0.0);
    assert(chapters[0].title == "first short second s...");

    assert(chapters[1].id == "ch-1");
    assert(chapters[1].time_seconds == 25.0);
    assert(chapters[1].title == "a long one");
}

void test_merge_edge_cases() {
    assert(merge_into_chapters({}).empty());

    // a single short segment is the last one: its own chapter
    {
        const auto chapters = merge_into_chapters({ make_segment(0, 0.0, 5.0, "only") });
        assert(chapters.size() == 1);
        assert(chapters[0].id == "ch-0");
        assert(chapters[0].title == "only");
    }

    // long, short, short(last): the trailing short run is flushed before the last segment
    {
        const auto chapters = merge_into_chapters({
            make_segment(0,   0.0,  90.0, "long"),
            make_segment(1,  90.0, 100.0, "short"),
            make_segment(2, 100.0, 110.0, "last"),
        }, 60.0, session_mode::lecture);

        assert(chapters.size() == 3);
        assert(chapters[0].id == "ch-0");
        assert(chapters[1].id == "merged-1");
        assert(chapters[1].time_seconds == 90.0);
        assert(chapters[1].title == "short");
        assert(chapters[2].id == "ch-2");
        assert(chapters[2].time_seconds == 100.0);
    }
}

void test_quick_chapters() {
    const auto chapters = quick_chapters(120.0, 4);
    assert(chapters.size() == 4);
    assert(chapters[0].id == "quick-0");
    assert(chapters[0].time_seconds == 0.0);
    assert(chapters[0].title == "Section 1");
    assert(chapters[3].id == "quick-3");
    assert(chapters[3].time_seconds == 90.0);
    assert(chapters[3].title == "Section 4");

    assert(quick_chapters(120.0, 0).empty());
}

void test_select_chapters() {
    const std::vector<chapter_marker> local  = { {"ch-0", 0.0, "local"} };
    const std::vector<chapter_marker> remote = { {"r-0", 0.0, "remote a"}, {"r-1", 30.0, "remote b"} };

    const auto replaced = select_chapters(local, remote);
    assert(replaced.size() == 2);
    assert(replaced[0].title == "remote a");

    const auto kept = select_chapters(local, {});
    assert(kept.size() == 1);
    assert(kept[0].title == "local");
}

int main() {
    test_title();
    test_chapters_from_segments();
    test_merge_example();
    test_merge_edge_cases();
    test_quick_chapters();
    test_select_chapters();

    printf("test-chapters: OK\n");

    return 0;
}
