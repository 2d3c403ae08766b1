// strata/cpp/src/records.cpp
#include "strata/records.h"
#include "strata/format.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "text_common.h"

namespace strata {

namespace {

// strtod на копии: string_view не обязан заканчиваться '\0'
static bool parse_double_strict(std::string_view sv, double& out) {
    const std::string s(trim_ws(sv));
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    if (std::isnan(v)) return false;
    out = v;
    return true;
}

static std::string with_line(const std::filesystem::path& p, size_t line_no, const std::string& msg) {
    return p.string() + ":" + std::to_string(line_no) + ": " + msg;
}

} // namespace

std::string strip_id_parens(std::string_view field) {
    const std::string_view t = trim_ws(field);
    if (t.size() >= 2 && t.front() == '(' && t.back() == ')') {
        return std::string(t.substr(1, t.size() - 2));
    }
    return std::string(t);
}

std::string format_trn_line(std::string_view text, std::string_view id) {
    std::string out;
    out.reserve(text.size() + id.size() + 3);
    out.append(text.data(), text.size());
    if (!text.empty()) out.push_back(' ');
    out.push_back('(');
    out.append(id.data(), id.size());
    out.push_back(')');
    return out;
}

bool parse_perplexity_line(std::string_view line, PerplexityRecord& out, std::string* err) {
    const size_t t1 = line.find('\t');
    const size_t t2 = (t1 == std::string_view::npos) ? t1 : line.find('\t', t1 + 1);
    if (t2 == std::string_view::npos) {
        if (err) *err = "expected 3 tab-separated fields (perplexity, text, (id))";
        return false;
    }

    const std::string_view ppl_sv = line.substr(0, t1);
    const std::string_view text_sv = line.substr(t1 + 1, t2 - t1 - 1);
    std::string_view id_sv = line.substr(t2 + 1);
    // хвост после id (лишние поля) не допускаем
    if (id_sv.find('\t') != std::string_view::npos) {
        if (err) *err = "too many tab-separated fields";
        return false;
    }

    if (!parse_double_strict(ppl_sv, out.perplexity)) {
        if (err) *err = "bad perplexity value '" + std::string(ppl_sv) + "'";
        return false;
    }

    out.text = std::string(trim_ws(text_sv));
    out.id = strip_id_parens(id_sv);
    if (out.id.empty()) {
        if (err) *err = "empty utterance id";
        return false;
    }
    return true;
}

bool parse_trn_line(std::string_view line, HypothesisRecord& out, std::string* err) {
    const std::string_view t = trim_ws(line);
    if (t.empty()) {
        if (err) *err = "empty line";
        return false;
    }

    size_t cut = t.size();
    while (cut > 0 && !is_ascii_space((unsigned char)t[cut - 1])) --cut;

    out.id = strip_id_parens(t.substr(cut));
    out.text = collapse_ws(t.substr(0, cut));
    out.raw = std::string(line);
    if (out.id.empty()) {
        if (err) *err = "empty utterance id";
        return false;
    }
    return true;
}

bool load_perplexity_file(const std::filesystem::path& p,
                          std::vector<PerplexityRecord>& out,
                          std::string* err) {
    out.clear();
    std::vector<std::string> lines;
    if (!read_lines(p, lines, err)) return false;

    out.reserve(lines.size());
    std::string e;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim_ws(lines[i]).empty()) continue;
        PerplexityRecord r;
        if (!parse_perplexity_line(lines[i], r, &e)) {
            if (err) *err = with_line(p, i + 1, e);
            return false;
        }
        out.push_back(std::move(r));
    }
    return true;
}

bool load_trn_file(const std::filesystem::path& p,
                   std::vector<HypothesisRecord>& out,
                   std::string* err) {
    out.clear();
    std::vector<std::string> lines;
    if (!read_lines(p, lines, err)) return false;

    out.reserve(lines.size());
    std::string e;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim_ws(lines[i]).empty()) continue;
        HypothesisRecord r;
        if (!parse_trn_line(lines[i], r, &e)) {
            if (err) *err = with_line(p, i + 1, e);
            return false;
        }
        r.line_no = (uint32_t)out.size() + 1;
        out.push_back(std::move(r));
    }
    return true;
}

} // namespace strata
