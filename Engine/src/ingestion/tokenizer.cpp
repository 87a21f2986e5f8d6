#include <ingestion/tokenizer.hpp>

namespace Lexigraph {

std::vector<Token> tokenize(const std::u32string& text) {
    std::vector<Token> tokens;
    const uint32_t n = static_cast<uint32_t>(text.size());

    uint32_t i = 0;
    while (i < n) {
        ScriptClass cls = script_class(text[i]);
        if (cls == ScriptClass::None) { ++i; continue; }

        uint32_t j = i + 1;
        while (j < n && script_class(text[j]) == cls) ++j;

        Token tok;
        tok.surface = text.substr(i, j - i);
        tok.folded = fold_case(tok.surface);
        tok.script = cls;
        tok.position = i;
        tokens.push_back(std::move(tok));
        i = j;
    }
    return tokens;
}

} // namespace Lexigraph
