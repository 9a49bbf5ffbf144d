// pattern_rules.cpp
// Deterministic rules: IBAN, Steuer-ID, Personalausweis, Aktenzeichen, contact data,
// addresses, amounts and dates. Checksums where the format has one, context keywords
// where the shape alone is ambiguous.

#include "ztredact/pattern_rules.h"

#include "ztredact/text_util.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace ztredact {

// ---------------- Validators ----------------
bool valid_iban(const std::string &s) {
    std::string compact;
    for (char c : s) if (!std::isspace((unsigned char)c)) compact += (char)::toupper((unsigned char)c);
    if (compact.size() < 15 || compact.size() > 34) return false;
    if (!std::isalpha((unsigned char)compact[0]) || !std::isalpha((unsigned char)compact[1])) return false;
    std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int rem = 0;
    for (char c : rearranged) {
        if (std::isdigit((unsigned char)c)) {
            rem = (rem * 10 + (c - '0')) % 97;
        } else if (std::isalpha((unsigned char)c)) {
            int v = c - 'A' + 10;
            rem = (rem * 100 + v) % 97;
        } else {
            return false;
        }
    }
    return rem == 1;
}

bool valid_tax_id(const std::string &s) {
    std::string d = digits_only(s);
    if (d.size() != 11 || d[0] == '0') return false;
    int counts[10] = {0};
    for (size_t i = 0; i < 10; ++i) counts[d[i] - '0']++;
    // exactly one digit repeats (twice or three times) within the first ten
    int repeated = 0;
    for (int c : counts) {
        if (c > 3) return false;
        if (c >= 2) repeated++;
    }
    if (repeated != 1) return false;
    int product = 10;
    for (size_t i = 0; i < 10; ++i) {
        int sum = (d[i] - '0' + product) % 10;
        if (sum == 0) sum = 10;
        product = (sum * 2) % 11;
    }
    int check = 11 - product;
    if (check == 10) check = 0;
    return check == d[10] - '0';
}

bool valid_id_card(const std::string &s) {
    if (s.size() != 10) return false;
    static const int weights[3] = {7, 3, 1};
    int total = 0;
    for (size_t i = 0; i < 9; ++i) {
        char c = (char)::toupper((unsigned char)s[i]);
        int v;
        if (std::isdigit((unsigned char)c)) v = c - '0';
        else if (c >= 'A' && c <= 'Z') v = c - 'A' + 10;
        else return false;
        total += v * weights[i % 3];
    }
    if (!std::isdigit((unsigned char)s[9])) return false;
    return total % 10 == s[9] - '0';
}

bool valid_phone(const std::string &s) {
    std::string d = digits_only(s);
    if (d.size() < 7 || d.size() > 15) return false;
    return std::any_of(d.begin(), d.end(), [&](char c){ return c != d[0]; });
}

bool valid_email(const std::string &s) {
    size_t at = s.find('@');
    if (at == std::string::npos || at == 0 || s.find('@', at + 1) != std::string::npos) return false;
    std::string local = s.substr(0, at);
    std::string domain = s.substr(at + 1);
    if (local.front() == '.' || local.back() == '.' || s.find("..") != std::string::npos) return false;
    size_t dot = domain.rfind('.');
    if (dot == std::string::npos || dot == 0 || domain.front() == '-') return false;
    std::string tld = domain.substr(dot + 1);
    return tld.size() >= 2 && std::all_of(tld.begin(), tld.end(), [](char c){ return std::isalpha((unsigned char)c); });
}

bool valid_case_number(const std::string &s) {
    static const std::regex parts(R"(^(\d{1,3}) ?([A-Za-z]{1,4}) ?(\d{1,5})/(\d{2,4})$)");
    static const std::unordered_set<std::string> registers = {
        "O", "C", "S", "T", "U", "K", "W", "E", "F", "R", "Ca", "Sa", "Ta", "AZR", "ZR", "Js",
        "Ds", "Ls", "Ns", "Qs", "UF", "WF", "OH", "HK", "BvR", "StR", "IN", "IK", "AR", "VA"
    };
    std::smatch m;
    if (!std::regex_match(s, m, parts)) return false;
    if (!registers.count(m[2].str())) return false;
    std::string year = m[4].str();
    if (year.size() == 3) return false;
    if (year.size() == 4) {
        int y = std::stoi(year);
        return y >= 1950 && y <= 2099;
    }
    return true;
}

static int month_from_name(const std::string &name) {
    static const char* months[] = {"januar", "februar", "märz", "april", "mai", "juni", "juli",
                                   "august", "september", "oktober", "november", "dezember"};
    std::string low = to_lower(name);
    for (int i = 0; i < 12; ++i) if (low == months[i]) return i + 1;
    return 0;
}

static bool valid_calendar_date(int d, int m, int y) {
    if (y < 1900 || y > 2100 || m < 1 || m > 12 || d < 1) return false;
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int max_day = days[m - 1];
    bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    if (m == 2 && leap) max_day = 29;
    return d <= max_day;
}

bool valid_date(const std::string &s) {
    static const std::regex dotted(R"(^(\d{1,2})\.(\d{1,2})\.(\d{2}|\d{4})$)");
    static const std::regex iso(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    static const std::regex spelled(R"(^(\d{1,2})\. ?(\S+) (\d{4})$)");
    std::smatch m;
    if (std::regex_match(s, m, dotted)) {
        int y = std::stoi(m[3].str());
        if (m[3].length() == 2) y += (y > 30 ? 1900 : 2000);
        return valid_calendar_date(std::stoi(m[1].str()), std::stoi(m[2].str()), y);
    }
    if (std::regex_match(s, m, iso)) {
        return valid_calendar_date(std::stoi(m[3].str()), std::stoi(m[2].str()), std::stoi(m[1].str()));
    }
    if (std::regex_match(s, m, spelled)) {
        int month = month_from_name(m[2].str());
        return month != 0 && valid_calendar_date(std::stoi(m[1].str()), month, std::stoi(m[3].str()));
    }
    return false;
}

bool valid_postal_code(const std::string &s) {
    std::string d = digits_only(s);
    if (d.size() != 5) return false;
    int v = std::stoi(d);
    return v >= 1001 && v <= 99998;
}

bool valid_street_address(const std::string &s) {
    size_t last = s.find_last_of("0123456789");
    if (last == std::string::npos) return false;
    size_t first = s.find_last_not_of("0123456789", last);
    first = first == std::string::npos ? 0 : first + 1;
    std::string d = s.substr(first, last - first + 1);
    if (d.size() > 4) return false;
    int n = std::stoi(d);
    return n >= 1 && n <= 9999;
}

bool valid_amount(const std::string &s) {
    std::string d = digits_only(s);
    return !d.empty() && std::any_of(d.begin(), d.end(), [](char c){ return c != '0'; });
}

// ---------------- Rule table ----------------
namespace {
const char* kUpper = "(?:[A-Z]|Ä|Ö|Ü)";
const char* kLower = "(?:[a-z]|ä|ö|ü|ß)";

std::vector<PatternRule> build_rules() {
    std::vector<PatternRule> rules;
    auto add = [&](std::string name, EntityKind kind, const std::string &re,
                   std::function<bool(const std::string&)> validate,
                   std::vector<std::string> keywords, double confidence) {
        PatternRule r;
        r.name = std::move(name);
        r.kind = kind;
        r.re = std::regex(re);
        r.validate = std::move(validate);
        r.keywords = std::move(keywords);
        r.confidence = confidence;
        rules.push_back(std::move(r));
    };

    add("iban", EntityKind::IBAN,
        R"(\b(?:DE\d{2}(?: ?\d{4}){4} ?\d{2}|AT\d{2}(?: ?\d{4}){4})\b)",
        valid_iban,
        {"iban", "konto", "bankverbindung", "überweisung", "bank", "account"}, 0.99);
    add("tax_id", EntityKind::TAX_ID,
        R"(\b\d{2} ?\d{3} ?\d{3} ?\d{3}\b)",
        valid_tax_id,
        {"steuer", "idnr", "identifikationsnummer", "steuernummer", "tax"}, 0.97);
    add("id_card", EntityKind::ID_NUMBER,
        R"(\b[CFGHJKLMNPRTVWXYZ][CFGHJKLMNPRTVWXYZ0-9]{8}\d\b)",
        valid_id_card,
        {"ausweis", "personalausweis", "reisepass", "pass", "dokumentennummer", "id"}, 0.97);
    add("email", EntityKind::EMAIL,
        R"(\b[A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,}\b)",
        valid_email,
        {"e-mail", "email", "mail", "kontakt", "erreichbar", "schreiben", "contact"}, 0.98);
    add("case_number", EntityKind::CASE_NUMBER,
        R"(\b\d{1,3} ?[A-Z][A-Za-z]{0,3} ?\d{1,5}/\d{2,4}\b)",
        valid_case_number,
        {"az", "aktenzeichen", "geschäftszeichen", "gz", "akte", "verfahren", "sache", "case"}, 0.95);
    add("date", EntityKind::DATE,
        std::string(R"(\b(?:\d{1,2}\.\d{1,2}\.(?:\d{4}|\d{2})|\d{4}-\d{2}-\d{2}|\d{1,2}\. ?)") +
            R"((?:Januar|Februar|März|April|Mai|Juni|Juli|August|September|Oktober|November|Dezember) \d{4})\b)",
        valid_date,
        {"geboren", "geb", "datum", "am", "vom", "den", "seit", "bis", "frist", "zum", "born", "date",
         "dated", "on"}, 0.95);
    add("phone", EntityKind::PHONE,
        R"((?:\+49|0049|\b0)[ \-/]?[1-9]\d{1,4}(?:[ \-/]?\d{2,8}){1,3}\b)",
        valid_phone,
        {"tel", "telefon", "fon", "mobil", "handy", "fax", "rufnummer", "phone", "erreichbar"}, 0.95);
    add("postal_code", EntityKind::POSTAL_CODE,
        std::string(R"(\b\d{5}(?= )") + kUpper + kLower + "{2,})",
        valid_postal_code,
        {"plz", "wohnhaft", "anschrift", "adresse", "wohnt", "postleitzahl", "in", "str", "straße",
         "address"}, 0.9);
    add("street_address", EntityKind::STREET_ADDRESS,
        std::string(R"(\b)") + kUpper + kLower + "+(?:straße|strasse|str\\.|weg|allee|platz|gasse|ring|damm|ufer)" +
            R"( \d{1,4}(?: ?[a-z]\b)?)",
        valid_street_address,
        {"wohnhaft", "anschrift", "adresse", "wohnt", "in", "zu", "residing", "address", "sitz"}, 0.9);
    add("amount", EntityKind::AMOUNT,
        R"(\b\d{1,3}(?:\.\d{3})*(?:,\d{2})? ?(?:EUR|€|Euro))",
        valid_amount,
        {"betrag", "summe", "zahlung", "schaden", "forderung", "höhe", "kosten", "gehalt", "miete",
         "amount"}, 0.9);
    return rules;
}

bool is_word_char(unsigned char c) { return std::isalnum(c) || c >= 0x80; }
} // namespace

const std::vector<PatternRule>& default_pattern_rules() {
    static const std::vector<PatternRule> rules = build_rules();
    return rules;
}

bool has_context_keyword(const std::string &text, TextSpan span, size_t window,
                         const std::vector<std::string> &keywords) {
    size_t left_start = span.start > window ? span.start - window : 0;
    size_t right_end = std::min(text.size(), span.end + window);
    std::string left = to_lower(text.substr(left_start, span.start - left_start));
    std::string right = to_lower(text.substr(span.end, right_end - span.end));

    auto found_in = [](const std::string &hay, const std::string &kw) {
        size_t pos = hay.find(kw);
        while (pos != std::string::npos) {
            bool left_ok = pos == 0 || !is_word_char((unsigned char)hay[pos - 1]);
            size_t after = pos + kw.size();
            bool right_ok = kw.size() > 3 || after >= hay.size() || !is_word_char((unsigned char)hay[after]);
            if (left_ok && right_ok) return true;
            pos = hay.find(kw, pos + 1);
        }
        return false;
    };
    for (auto &kw : keywords) {
        if (found_in(left, kw) || found_in(right, kw)) return true;
    }
    return false;
}

std::vector<PatternMatch> scan_patterns(const std::string &text, const std::vector<PatternRule> &rules,
                                        bool require_context, size_t window) {
    std::vector<PatternMatch> out;
    for (auto &rule : rules) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), rule.re); it != std::sregex_iterator(); ++it) {
            const std::smatch &m = *it;
            if (m.length(0) == 0) continue;
            TextSpan span{(size_t)m.position(0), (size_t)(m.position(0) + m.length(0))};
            std::string value = m.str(0);
            if (rule.validate && !rule.validate(value)) continue;
            if (require_context && !has_context_keyword(text, span, window, rule.keywords)) continue;
            out.push_back({span, &rule});
        }
    }
    return out;
}

} // namespace ztredact
