#include "depver/struct_table.hpp"
#include "depver/errors.hpp"
#include "depver/integrity.hpp"
#include "depver/log.hpp"

#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace depver {

namespace {

constexpr std::string_view kVersionSuffix = "_VERSION";
constexpr std::string_view kSha256Suffix = "_SHA256";
constexpr std::string_view kIntegritySuffix = "_INTEGRITY";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() > suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool IsIdentifier(std::string_view s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front()))) return false;
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') return false;
    }
    return true;
}

// Names map to keys by uppercasing, so only lowercase names come back intact.
bool IsLowerIdentifier(std::string_view s) {
    if (!IsIdentifier(s)) return false;
    for (char c : s) {
        if (std::isupper(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// A value must stay inside its "..." literal.
bool IsQuotable(std::string_view s) {
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\' || std::iscntrl(uc)) return false;
    }
    return true;
}

std::string QuotedOrThrow(const DependencyRecord& rec, std::string_view field, const std::string& value) {
    if (!IsQuotable(value)) {
        throw std::invalid_argument(std::string(field) + " of '" + rec.name +
                                    "' contains quotes, escapes or control characters");
    }
    return "\"" + value + "\"";
}

// Drops a '#' comment that is not inside a string literal.
std::string_view StripComment(std::string_view line) {
    bool in_string = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') in_string = !in_string;
        else if (line[i] == '#' && !in_string) return line.substr(0, i);
    }
    return line;
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string ToUpper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

class StructTableParser {
public:
    std::vector<DependencyRecord> parse(std::string_view text) {
        std::size_t pos = 0;
        while (pos <= text.size()) {
            const auto eol = text.find('\n', pos);
            const auto raw = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            ++line_no_;
            parse_line(Trim(StripComment(raw)));
            if (eol == std::string_view::npos) break;
            pos = eol + 1;
        }

        if (state_ == State::BeforeTable) bad("no 'name = struct(' table found");
        if (state_ == State::InTable) bad("unterminated struct(, expected ')'");

        Logger::verbose("Struct table parsed: {} records", records_.size());
        return std::move(records_);
    }

private:
    enum class State { BeforeTable, InTable, AfterTable };

    [[noreturn]] void bad(const std::string& msg) const {
        throw LoadError("struct table line " + std::to_string(line_no_) + ": " + msg);
    }

    void parse_line(std::string_view s) {
        if (s.empty()) return;

        switch (state_) {
            case State::BeforeTable:
                parse_header(s);
                return;
            case State::InTable:
                if (s == ")") {
                    state_ = State::AfterTable;
                    return;
                }
                parse_entry(s);
                return;
            case State::AfterTable:
                bad("unexpected content after closing ')'");
        }
    }

    void parse_header(std::string_view s) {
        const auto eq = s.find('=');
        if (eq == std::string_view::npos) bad("expected 'name = struct('");

        const auto lhs = Trim(s.substr(0, eq));
        const auto rhs = Trim(s.substr(eq + 1));
        if (!IsIdentifier(lhs)) bad("invalid table name '" + std::string(lhs) + "'");
        if (rhs != "struct(") bad("expected 'struct(' after '='");
        state_ = State::InTable;
    }

    void parse_entry(std::string_view s) {
        if (!s.empty() && s.back() == ',') s = Trim(s.substr(0, s.size() - 1));

        const auto eq = s.find('=');
        if (eq == std::string_view::npos) bad("expected KEY = \"value\"");

        const auto key = Trim(s.substr(0, eq));
        const auto rhs = Trim(s.substr(eq + 1));
        if (!IsIdentifier(key)) bad("invalid key '" + std::string(key) + "'");

        if (rhs.size() < 2 || rhs.front() != '"' || rhs.back() != '"') {
            bad("value of " + std::string(key) + " must be a string literal");
        }
        const auto value = rhs.substr(1, rhs.size() - 2);
        if (value.find_first_of("\"\\") != std::string_view::npos) {
            bad("value of " + std::string(key) + " contains quotes or escapes");
        }

        if (EndsWith(key, kVersionSuffix)) {
            const auto prefix = key.substr(0, key.size() - kVersionSuffix.size());
            records_.push_back({ToLower(prefix), std::string(value), std::nullopt});
        } else if (EndsWith(key, kSha256Suffix)) {
            attach_hash(key.substr(0, key.size() - kSha256Suffix.size()), value);
        } else if (EndsWith(key, kIntegritySuffix)) {
            attach_hash(key.substr(0, key.size() - kIntegritySuffix.size()), value);
        } else {
            bad("key '" + std::string(key) + "' has no _VERSION, _SHA256 or _INTEGRITY suffix");
        }
    }

    // Binds to the latest record with that prefix.
    void attach_hash(std::string_view prefix, std::string_view value) {
        const auto name = ToLower(prefix);
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (it->name != name) continue;
            if (it->integrity_hash) bad("second hash for " + name);
            it->integrity_hash = std::string(value);
            return;
        }
        bad("hash for " + name + " appears before its version");
    }

    State state_ = State::BeforeTable;
    int line_no_ = 0;
    std::vector<DependencyRecord> records_;
};

} // namespace

std::vector<DependencyRecord> parse_struct_table(std::string_view text) {
    StructTableParser parser;
    return parser.parse(text);
}

std::string render_struct_table(const Registry& registry, std::string_view table_name) {
    if (!IsIdentifier(table_name)) {
        throw std::invalid_argument("invalid table name: " + std::string(table_name));
    }

    std::ostringstream os;
    os << table_name << " = struct(\n";

    bool first = true;
    for (const auto& rec : registry.all()) {
        if (!IsLowerIdentifier(rec.name)) {
            throw std::invalid_argument("dependency name cannot be used as a key: '" + rec.name + "'");
        }
        const auto prefix = ToUpper(rec.name);
        const auto version = QuotedOrThrow(rec, "version", rec.version);

        if (!first) os << "\n";
        first = false;

        os << "    # " << rec.name << "\n";
        os << "    " << prefix << kVersionSuffix << " = " << version << ",\n";

        if (rec.integrity_hash) {
            const auto parsed = IntegrityHash::parse(*rec.integrity_hash);
            if (parsed && parsed->algorithm() == HashAlgorithm::Sha256) {
                os << "    " << prefix << kSha256Suffix << " = \"" << parsed->digest() << "\",\n";
            } else {
                os << "    " << prefix << kIntegritySuffix << " = "
                   << QuotedOrThrow(rec, "integrity hash", *rec.integrity_hash) << ",\n";
            }
        }
    }

    os << ")\n";
    return os.str();
}

} // namespace depver
