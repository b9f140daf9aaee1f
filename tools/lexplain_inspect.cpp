#include "lexplain/explain/config.hpp"
#include "lexplain/text/indexed_document.hpp"

#include <charconv>
#include <cstddef>
#include <system_error>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using lexplain::text::IndexedDocument;
using lexplain::text::IndexingMode;
using lexplain::text::feature_id;

namespace {
struct Args {
    std::string input;                // empty => stdin
    std::optional<std::string> text;  // inline document, wins over input
    std::optional<IndexingMode> mode; // unset => environment / default
    std::vector<feature_id> remove;
    bool do_remove{false};
    bool quiet{false};                // skip the feature table
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "lexplain document inspector\n"
              << "Usage: lexplain_inspect [--input=path | --text=document] [--mode=bow|positional]\n"
              << "  [--positional] [--remove=0,3,5] [--quiet]\n"
              << "Reads stdin when neither --input nor --text is given.\n"
              << "LEXPLAIN_BOW=0 selects positional mode unless --mode/--positional is given.\n";
}

static std::optional<std::vector<feature_id>> parse_csv_ids(const std::string& s) {
    std::vector<feature_id> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        if (tok.empty()) continue;
        feature_id v{};
        auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
        if (ec != std::errc{} || p != tok.data() + tok.size()) return std::nullopt;
        out.push_back(v);
    }
    return out;
}

static std::string escape(std::string_view s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c;
        }
    }
    return out;
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        if (a == "--positional") { args.mode = IndexingMode::positional; continue; }
        if (a == "--quiet") { args.quiet = true; continue; }
        if (auto v = eat(a, "--input=")) { args.input = *v; continue; }
        if (auto v = eat(a, "--text=")) { args.text = *v; continue; }
        if (auto v = eat(a, "--mode=")) {
            auto m = lexplain::text::parse_indexing_mode(*v);
            if (!m) { std::cerr << "error: " << m.error().message << "\n"; return 2; }
            args.mode = *m;
            continue;
        }
        if (auto v = eat(a, "--remove=")) {
            auto ids = parse_csv_ids(*v);
            if (!ids) { std::cerr << "error: bad id list '" << *v << "'\n"; return 2; }
            args.remove = std::move(*ids);
            args.do_remove = true;
            continue;
        }
        std::cerr << "Unknown arg: " << a << "\n";
        print_usage();
        return 2;
    }

    lexplain::explain::ExplainerConfig config;
    lexplain::explain::apply_env_overrides(config);
    if (args.mode) config.mode = *args.mode;

    std::string text;
    if (args.text) {
        text = *args.text;
    } else if (args.input.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(args.input, std::ios::binary);
        if (!in) { std::cerr << "error: cannot open " << args.input << "\n"; return 1; }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    const IndexedDocument doc(std::move(text), config.mode);
    std::cout << "mode=" << lexplain::text::to_string(doc.mode())
              << " tokens=" << doc.num_tokens()
              << " features=" << doc.num_features() << "\n";

    if (!args.quiet) {
        for (feature_id id = 0; id < doc.num_features(); ++id) {
            auto word = doc.feature_text(id);
            auto offsets = doc.feature_positions(id);
            if (!word || !offsets) { std::cerr << "error: feature " << id << " unreadable\n"; return 1; }
            std::cout << id << "\t" << escape(*word) << "\t";
            for (std::size_t k = 0; k < offsets->size(); ++k) std::cout << (k ? "," : "") << (*offsets)[k];
            std::cout << "\n";
        }
    }

    if (args.do_remove) {
        auto out = doc.remove(args.remove);
        if (!out) {
            std::cerr << "error: " << lexplain::core::to_string(out.error().code) << ": " << out.error().message << "\n";
            return 1;
        }
        std::cout << "removed: " << escape(*out) << "\n";
    }
    return 0;
}
