#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "strata/tokenizer.h"

static std::string plain(const std::string& line) {
    return strata::tokenize_trn_line(line, strata::plain_tokenizer_options());
}

static std::string phon(const std::string& line) {
    return strata::tokenize_trn_line(line, strata::phonetic_tokenizer_options());
}

int main() {
    // word boundary marker + one token per character, id unsplit
    assert(plain("cat dog (utt01)") == "c a t _ d o g (utt01)");
    assert(strata::join_tokens(strata::tokenize("cat dog")) == "c a t _ d o g");

    // whitespace runs collapse, leading/trailing whitespace dropped
    assert(plain("  cat \t  dog   (utt01)  ") == "c a t _ d o g (utt01)");

    // only the id field
    assert(plain("(utt07)") == "(utt07)");
    assert(plain("   ") == "");

    // multi-byte code points are single tokens
    {
        auto t = strata::tokenize("\xD0\xBA\xD0\xBE\xD1\x82"); // кот
        assert(t.size() == 3);
        assert(t[0] == "\xD0\xBA");
    }

    // plain mode does not know clusters
    assert(plain("t\xCA\x83\xCB\x90 (u1)") == "t \xCA\x83 \xCB\x90 (u1)");

    // phonetic: tʃː, dʒ, length mark, filler
    assert(phon("t\xCA\x83\xCB\x90" "a (u1)") == "t\xCA\x83\xCB\x90 a (u1)");
    assert(phon("d\xCA\x92" "a dza (u2)") == "d\xCA\x92 a _ dz a (u2)");
    assert(phon("a\xCB\x90 b (u3)") == "a\xCB\x90 _ b (u3)");
    assert(phon("[fp] ok (u4)") == "[fp] _ o k (u4)");

    // ordered list: "dzː" wins over "dz"
    {
        auto t = strata::tokenize_phonetic("dz\xCB\x90i");
        assert(t.size() == 2);
        assert(t[0] == "dz\xCB\x90");
        assert(t[1] == "i");
    }

    // "[" alone is not a filler
    {
        auto t = strata::tokenize_phonetic("[f]");
        assert(t.size() == 3);
    }

    // custom word marker
    {
        strata::TokenizerOptions opt = strata::plain_tokenizer_options();
        opt.word_marker = "|";
        assert(strata::tokenize_trn_line("ab cd (x)", opt) == "a b | c d (x)");
    }

    // invalid UTF-8 byte passes through as its own token
    {
        auto t = strata::tokenize(std::string("a\xFF" "b"));
        assert(t.size() == 3);
        assert(t[1] == "\xFF");
    }

    std::cout << "OK\n";
    return 0;
}
