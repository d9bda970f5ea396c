#pragma once
#include <string>
#include <vector>

struct SourceDoc {
    std::string doc_id;
    std::string text;
};

bool read_all_text(const std::string& path, std::string& out);

// One document per path; paths with a suffix outside `exts` go to `rejected`,
// unreadable paths make the call fail (returns false, `err` set).
bool load_source_files(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& exts,
    std::vector<SourceDoc>& docs,
    std::vector<std::string>& rejected,
    std::string& err
);

// JSONL: {"doc_id":"...","text":"..."} per line. Broken lines and lines with
// a missing/empty field are skipped (counted in `skipped`).
bool load_jsonl_corpus(
    const std::string& path,
    std::vector<SourceDoc>& docs,
    int& skipped,
    std::string& err
);
