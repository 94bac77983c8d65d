#pragma once

#include <string>
#include <vector>
#include <platform/process.hpp>
#include <platform/append_file.hpp>
#include "job.hpp"

// Splits a byte stream into lines. Bytes up to '\n' form a line; invalid
// UTF-8 is discarded, everything else is kept verbatim. A run longer than
// MAX_OUTPUT_LINE without a newline is emitted in MAX_OUTPUT_LINE pieces.
class LineSplitter {
public:
    // Append a chunk; returns the lines it completed.
    std::vector<std::string> feed(const std::string& chunk);

    // Unterminated remainder at end of stream, if any.
    bool flush(std::string& line);

private:
    std::string pending_;
};

// Consumes one process's merged output on behalf of one job: each line goes
// to the transcript (flushed), then the history, then marker interpretation.
// At end of stream the exit code settles the job.
class OutputPipeline {
public:
    explicit OutputPipeline(Job& job);

    // Open the transcript for append. Failure is logged; lines still reach
    // the history.
    bool open_transcript();

    // Handle a single output line.
    void process_line(const std::string& line);

    // Read until EOF, wait for exit, finish the job. Returns the exit code.
    int run(platform::ProcessHandle& proc);

private:
    Job& job_;
    platform::AppendFile transcript_;
};
