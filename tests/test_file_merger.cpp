#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include <json/json.h>
#include "../src/FileMerger.hpp"
#include "../src/MergeError.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static const std::string F1 = "111 112\n121 122\n131 132\n";
static const std::string F2 = "211 212\n221 222\n231 232\n";
static const std::string F3 = "311 312\n332 322\n331 332";

static std::string writeTemp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / ("filemerge_test_" + name);
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
    ofs.close();
    return path.string();
}

static std::string merge(const MergeOptions& options, const std::vector<std::string>& paths) {
    std::ostringstream out;
    FileMerger merger(options);
    MergeResult result = merger.write(paths, out);
    std::string s = out.str();
    if (result.bytesWritten != s.size() || result.filesMerged != paths.size()) {
        return "<result mismatch>";
    }
    return s;
}

int main() {
    std::vector<std::string> files;
    try {
        files.push_back(writeTemp("f1.txt", F1));
        files.push_back(writeTemp("f2.txt", F2));
        files.push_back(writeTemp("f3.txt", F3));

        // 1) No options: plain byte concatenation
        ASSERT_TRUE(merge(MergeOptions(), files) == F1 + F2 + F3);

        // 2) Head skip, tail skip once, forced LF, padding everywhere
        {
            MergeOptions options;
            options.skipHead(Skip::Lines(1))
                .skipTail(Skip::LinesOnce(1))
                .forceEndingNewline(Newline::Lf)
                .padWith(Pad::Custom(std::string(" padding "), std::string(" padding "), std::string(" padding ")));
            ASSERT_TRUE(merge(options, files) ==
                        " padding 121 122\n padding 221 222\n padding 332 322\n331 332\n padding ");
        }

        // 3) Once exemptions
        {
            MergeOptions head;
            head.skipHead(Skip::LinesOnce(1));
            ASSERT_TRUE(merge(head, files) == F1 + "221 222\n231 232\n" + "332 322\n331 332");

            MergeOptions tail;
            tail.skipTail(Skip::LinesOnce(1));
            ASSERT_TRUE(merge(tail, files) == "111 112\n121 122\n" + std::string("211 212\n221 222\n") + F3);
        }

        // 4) Padding placement
        {
            MergeOptions before;
            before.padWith(Pad::Before("P"));
            ASSERT_TRUE(merge(before, files) == "P" + F1 + F2 + F3);

            MergeOptions between;
            between.padWith(Pad::Between("P"));
            ASSERT_TRUE(merge(between, files) == F1 + "P" + F2 + "P" + F3);

            MergeOptions after;
            after.padWith(Pad::After("P"));
            ASSERT_TRUE(merge(after, files) == F1 + F2 + F3 + "P");

            MergeOptions custom;
            custom.padWith(Pad::Custom(std::string("P"), std::string("P"), std::string("P")));
            ASSERT_TRUE(merge(custom, files) == "P" + F1 + "P" + F2 + "P" + F3 + "P");
        }

        // 5) Newline normalization appends at most one terminator per file
        {
            MergeOptions lf;
            lf.forceEndingNewline(Newline::Lf);
            ASSERT_TRUE(merge(lf, files) == F1 + F2 + F3 + "\n");

            MergeOptions crlf;
            crlf.forceEndingNewline(Newline::Crlf);
            ASSERT_TRUE(merge(crlf, files) == F1 + F2 + F3 + "\r\n");

            std::string empty = writeTemp("empty.txt", "");
            files.push_back(empty);
            ASSERT_TRUE(merge(lf, {empty}) == "\n");
            ASSERT_TRUE(merge(MergeOptions(), {empty, files[2]}) == F3);
        }

        // 6) Skipping whole files leaves nothing but padding
        {
            MergeOptions options;
            options.skipHead(Skip::Lines(3)).padWith(Pad::Between("|"));
            ASSERT_TRUE(merge(options, {files[0], files[1], files[2]}) == "||");
        }

        // 7) Content larger than one copy chunk
        {
            std::string big;
            for (int i = 0; i < 3000; ++i) {
                big += "row " + std::to_string(i) + "\n";
            }
            std::string bigPath = writeTemp("big.txt", big);
            files.push_back(bigPath);
            MergeOptions options;
            options.skipHead(Skip::Lines(1)).skipTail(Skip::Lines(1));
            std::string expected = big.substr(6, big.size() - 6 - std::string("row 2999\n").size());
            ASSERT_TRUE(merge(options, {bigPath}) == expected);
            ASSERT_TRUE(merge(MergeOptions(), {bigPath, files[0]}) == big + F1);
        }

        // 8) A missing file aborts the run; later files are not processed
        {
            std::vector<std::string> paths = {files[0], "/nonexistent/filemerge/missing.txt", files[2]};
            std::ostringstream out;
            FileMerger merger(MergeOptions{});
            bool threw = false;
            try {
                merger.write(paths, out);
            } catch (const MergeError& e) {
                threw = true;
                ASSERT_TRUE(e.kind() == ErrorKind::IoFailure);
                ASSERT_TRUE(e.path() && *e.path() == paths[1]);
                ASSERT_TRUE(e.index() && *e.index() == 1);
                ASSERT_TRUE(e.outputPosition() && *e.outputPosition() == F1.size());
                ASSERT_TRUE((bool)e.code());
            }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(out.str() == F1);
        }

        // 9) Insufficient content aborts at the failing file
        {
            MergeOptions options;
            options.skipTail(Skip::Lines(4));
            std::ostringstream out;
            FileMerger merger(options);
            bool threw = false;
            try {
                merger.write(files, out);
            } catch (const MergeError& e) {
                threw = true;
                ASSERT_TRUE(e.kind() == ErrorKind::InsufficientContent);
                ASSERT_TRUE(e.end() && *e.end() == SkipEnd::Tail);
                ASSERT_TRUE(e.index() && *e.index() == 0);
                Json::Value j = e.toJson();
                ASSERT_TRUE(j["kind"].asString() == "insufficient_content");
                ASSERT_TRUE(j["end"].asString() == "tail");
                ASSERT_TRUE(j["path"].asString() == files[0]);
            }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(out.str().empty());
        }

        // 10) No input files
        {
            std::ostringstream out;
            FileMerger merger(MergeOptions{});
            bool threw = false;
            try {
                merger.write({}, out);
            } catch (const MergeError& e) {
                threw = e.kind() == ErrorKind::EmptyInput;
            }
            ASSERT_TRUE(threw);
        }

        // 11) Progress is reported after every file
        {
            std::vector<Json::Value> reports;
            std::ostringstream out;
            FileMerger merger(MergeOptions{});
            std::vector<std::string> three = {files[0], files[1], files[2]};
            merger.write(three, out, [&reports](const Json::Value& p) { reports.push_back(p); });
            ASSERT_TRUE(reports.size() == 3);
            ASSERT_TRUE(reports[0]["files_done"].asUInt64() == 1);
            ASSERT_TRUE(reports[0]["bytes_written"].asUInt64() == F1.size());
            ASSERT_TRUE(reports[2]["files_total"].asUInt64() == 3);
            ASSERT_TRUE(reports[2]["bytes_written"].asUInt64() == out.str().size());
            ASSERT_TRUE(reports[2]["path"].asString() == files[2]);
            ASSERT_TRUE(reports[2]["progress"].asDouble() == 1.0);
        }

        // 12) Caller-owned streams
        {
            std::istringstream a(F1), b(F3);
            std::ostringstream out;
            MergeOptions options;
            options.skipHead(Skip::BytesOnce(8)).forceEndingNewline(Newline::Crlf);
            FileMerger merger(options);
            MergeResult result = merger.writeStreams({&a, &b}, out);
            ASSERT_TRUE(out.str() == F1 + "332 322\n331 332\r\n");
            ASSERT_TRUE(result.filesMerged == 2);
            ASSERT_TRUE(result.bytesWritten == out.str().size());
        }

        // 13) A failing sink is an IoFailure
        {
            std::ostringstream out;
            out.setstate(std::ios::badbit);
            FileMerger merger(MergeOptions{});
            bool threw = false;
            try {
                merger.write({files[0]}, out);
            } catch (const MergeError& e) {
                threw = e.kind() == ErrorKind::IoFailure;
            }
            ASSERT_TRUE(threw);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    for (const auto& f : files) {
        std::error_code ec;
        std::filesystem::remove(f, ec);
    }
    std::cout << "All file merger tests passed" << std::endl;
    return 0;
}
