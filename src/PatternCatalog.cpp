#include "PatternCatalog.h"

#include "VeilExceptions.h"

#include <algorithm>
#include <cstddef>

namespace {
PatternRule makeRule(const std::string& name,
                     DetectorCategory category,
                     const char* pattern,
                     bool ignoreCase = false) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (ignoreCase) flags |= std::regex::icase;
    return PatternRule{name, category, std::regex(pattern, flags)};
}

PatternRule structural(const std::string& name, const char* pattern, bool ignoreCase = false) {
    return makeRule(name, DetectorCategory::STRUCTURAL, pattern, ignoreCase);
}

PatternRule heuristic(const std::string& name, const char* pattern, bool ignoreCase = false) {
    return makeRule(PatternCatalog::kHeuristicPrefix + name, DetectorCategory::HEURISTIC, pattern, ignoreCase);
}
} // namespace

namespace PatternScan {
std::vector<Match> findAll(const std::regex& pattern, const std::string& text) {
    static_assert(kWindowBytes > kMaxMatchBytes, "scan windows must overlap");

    std::vector<Match> matches;
    size_t cursor = 0;
    std::smatch m;

    while (cursor <= text.size()) {
        const size_t windowEnd = std::min(text.size(), cursor + kWindowBytes);
        const bool lastWindow = windowEnd == text.size();
        // Only matches starting before this are final; later ones are looked
        // at again by the next window, which sees more of the text.
        const size_t commitLimit = lastWindow ? text.size() + 1 : windowEnd - kMaxMatchBytes;

        auto flags = std::regex_constants::match_default;
        // Lets \b see the character before the cursor.
        if (cursor > 0) flags |= std::regex_constants::match_prev_avail;
        // The window end is not the end of the text.
        if (!lastWindow) flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;

        const auto first = text.cbegin() + static_cast<std::ptrdiff_t>(cursor);
        const auto last = text.cbegin() + static_cast<std::ptrdiff_t>(windowEnd);
        if (!std::regex_search(first, last, m, pattern, flags)) {
            if (lastWindow) break;
            cursor = commitLimit;
            continue;
        }

        const size_t start = cursor + static_cast<size_t>(m.position(0));
        if (start >= commitLimit) {
            cursor = commitLimit;
            continue;
        }
        matches.push_back({start, m.str(0)});

        size_t next = start + static_cast<size_t>(m.length(0));
        if (m.length(0) == 0) {
            if (next == text.size()) break;
            ++next;
        }
        cursor = next;
    }
    return matches;
}
} // namespace PatternScan

PatternCatalog::PatternCatalog() {
    structural_ = {
        structural("ssn", R"(\b\d{3}[-.\s]?\d{2}[-.\s]?\d{4}\b)"),
        structural("phone", R"(\b(?:\+?1[-.\s]?)?\(?([0-9]{3})\)?[-.\s]?([0-9]{3})[-.\s]?([0-9]{4})\b)"),
        structural("email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)"),
        structural("credit_card",
                   R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|3[0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12})\b)"),
        structural("drivers_license", R"(\b[A-Z]{1,2}\d{6,8}\b)"),
        structural("passport", R"(\b[A-Z0-9]{6,9}\b)"),
        structural("bank_account", R"(\b\d{8,17}\b)"),
        structural("ip_address", R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)"),
        structural("mac_address",
                   R"(\b[0-9A-Fa-f]{2}[:-][0-9A-Fa-f]{2}[:-][0-9A-Fa-f]{2}[:-][0-9A-Fa-f]{2}[:-][0-9A-Fa-f]{2}[:-][0-9A-Fa-f]{2}\b)"),
        structural("date_of_birth",
                   R"(\b(?:0[1-9]|1[0-2])[/\-.](?:0[1-9]|[12]\d|3[01])[/\-.]\d{4}\b|\b(?:0[1-9]|[12]\d|3[01])[/\-.](?:0[1-9]|1[0-2])[/\-.]\d{4}\b)"),
        structural("address",
                   R"(\b\d+\s+[A-Za-z\s]+(?:Street|St|Avenue|Ave|Road|Rd|Lane|Ln|Drive|Dr|Court|Ct|Place|Pl)\b)",
                   true),
        structural("zip_code", R"(\b\d{5}(?:-\d{4})?\b)"),
    };

    heuristic_ = {
        heuristic("full_name", R"(\b[A-Z][a-z]+\s+[A-Z][a-z]+\b)"),
        heuristic("name_with_middle", R"(\b[A-Z][a-z]+\s+[A-Z]\.\s+[A-Z][a-z]+\b)"),
        heuristic("name_with_title", R"(\b(?:Mr|Mrs|Ms|Dr|Prof)\.\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+)?\b)"),
        heuristic("company",
                  R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*\s+(?:Inc|LLC|Corp|Company|Co|Ltd|Corporation)\b)"),
        heuristic("organization",
                  R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*\s+(?:University|College|School|Hospital|Bank|Group)\b)"),
        heuristic("city_state", R"(\b[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*,\s+[A-Z]{2}\b)"),
        heuristic("country",
                  R"(\b(?:United States|USA|Canada|Mexico|England|France|Germany|Japan|China|India)\b)"),
        heuristic("currency", R"(\$[\d,]+(?:\.\d{2})?|\b\d+\s+dollars?\b)", true),
        heuristic("month_day_year",
                  R"(\b(?:January|February|March|April|May|June|July|August|September|October|November|December)\s+\d{1,2},?\s+\d{4}\b)"),
    };

    keywords_ = {
        "ssn", "social security", "ssn#", "social security number",
        "passport", "driver license", "drivers license", "dl#",
        "credit card", "debit card", "card number", "account number",
        "routing number", "bank account", "iban", "swift",
        "date of birth", "dob", "birthday", "birth date",
        "maiden name", "mother maiden", "security question",
        "medical record", "patient id", "mrn", "health insurance",
        "tax id", "tin", "ein", "employee id"
    };

    denylist_ = {"Main Street", "First Name", "Last Name", "Full Name", "Company Name"};
}

std::shared_ptr<const PatternCatalog> PatternCatalog::defaults() {
    static const std::shared_ptr<const PatternCatalog> instance = std::make_shared<const PatternCatalog>();
    return instance;
}

bool PatternCatalog::isDenylisted(const std::string& text) const {
    return denylist_.find(text) != denylist_.end();
}

std::vector<std::string> PatternCatalog::entityTypes() const {
    std::vector<std::string> out;
    out.reserve(structural_.size() + heuristic_.size() + 1);
    for (const auto& rule : structural_) out.push_back(rule.name);
    for (const auto& rule : heuristic_) out.push_back(rule.name);
    if (!keywords_.empty()) out.push_back(kContextualType);
    return out;
}

std::shared_ptr<const PatternCatalog> PatternCatalog::withoutTypes(const std::vector<std::string>& types) const {
    const std::vector<std::string> known = entityTypes();
    for (const auto& type : types) {
        if (std::find(known.begin(), known.end(), type) == known.end()) {
            throw Veil::ConfigurationException("Unknown entity type: " + type);
        }
    }

    auto excluded = [&types](const std::string& name) {
        return std::find(types.begin(), types.end(), name) != types.end();
    };

    auto copy = std::make_shared<PatternCatalog>(*this);
    copy->structural_.erase(std::remove_if(copy->structural_.begin(), copy->structural_.end(),
                                           [&](const PatternRule& r) { return excluded(r.name); }),
                            copy->structural_.end());
    copy->heuristic_.erase(std::remove_if(copy->heuristic_.begin(), copy->heuristic_.end(),
                                          [&](const PatternRule& r) { return excluded(r.name); }),
                           copy->heuristic_.end());
    if (excluded(kContextualType)) copy->keywords_.clear();
    return copy;
}
