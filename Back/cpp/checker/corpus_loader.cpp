#include "corpus_loader.h"

#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <simdjson.h>

#include "checker_config.h"

bool read_all_text(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    in.seekg(0, std::ios::end);
    std::streamoff n = in.tellg();
    in.seekg(0, std::ios::beg);
    if (n < 0) n = 0;
    out.resize((std::size_t)n);
    if (!out.empty()) in.read(out.data(), (std::streamsize)out.size());
    return (bool)in || in.eof();
}

bool load_source_files(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& exts,
    std::vector<SourceDoc>& docs,
    std::vector<std::string>& rejected,
    std::string& err
) {
    docs.reserve(docs.size() + paths.size());

    for (const auto& p : paths) {
        if (!has_accepted_extension(p, exts)) {
            rejected.push_back(p);
            continue;
        }
        SourceDoc d;
        d.doc_id = p;
        if (!read_all_text(p, d.text)) {
            err = "cannot open " + p;
            return false;
        }
        docs.push_back(std::move(d));
    }
    return true;
}

bool load_jsonl_corpus(
    const std::string& path,
    std::vector<SourceDoc>& docs,
    int& skipped,
    std::string& err
) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open " + path;
        return false;
    }

    simdjson::dom::parser parser;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;

        simdjson::dom::element doc;
        auto e = parser.parse(line).get(doc);
        if (e) { ++skipped; continue; }

        std::string_view did_sv;
        e = doc["doc_id"].get(did_sv);
        if (e || did_sv.empty()) { ++skipped; continue; }

        std::string_view text_sv;
        e = doc["text"].get(text_sv);
        if (e || text_sv.empty()) { ++skipped; continue; }

        docs.push_back(SourceDoc{std::string(did_sv), std::string(text_sv)});
    }
    return true;
}
