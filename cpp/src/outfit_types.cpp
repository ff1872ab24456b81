#include "outfit_types.hpp"

#include <map>

namespace Fitcast {

namespace {

const std::map<Occasion, std::pair<std::string, std::string>>& occasionTable() {
    static const std::map<Occasion, std::pair<std::string, std::string>> table = {
        {Occasion::JOB_INTERVIEW,   {"job_interview",   "professional job interview"}},
        {Occasion::DATE_NIGHT,      {"date_night",      "romantic date night"}},
        {Occasion::CASUAL_HANGOUT,  {"casual_hangout",  "casual social gathering"}},
        {Occasion::WORK_MEETING,    {"work_meeting",    "business work meeting"}},
        {Occasion::FORMAL_EVENT,    {"formal_event",    "formal wedding or gala event"}},
        {Occasion::BEACH_VACATION,  {"beach_vacation",  "beach or vacation setting"}},
        {Occasion::NIGHT_OUT,       {"night_out",       "night out with friends"}},
        {Occasion::BUSINESS_CASUAL, {"business_casual", "business casual workplace"}}
    };
    return table;
}

std::string availableOccasionKeys() {
    std::string keys;
    for (const auto& occasion : allOccasions()) {
        if (!keys.empty()) keys += ", ";
        keys += occasionKey(occasion);
    }
    return keys;
}

} // namespace

InvalidOccasionError::InvalidOccasionError(const std::string& occasion)
    : AnalysisError("Invalid occasion '" + occasion + "'. Available: " + availableOccasionKeys()),
      occasion_(occasion) {}

std::string itemClassName(ItemClass itemClass) {
    switch (itemClass) {
        case ItemClass::SUNGLASS: return "sunglass";
        case ItemClass::HAT:      return "hat";
        case ItemClass::JACKET:   return "jacket";
        case ItemClass::SHIRT:    return "shirt";
        case ItemClass::PANTS:    return "pants";
        case ItemClass::SHORTS:   return "shorts";
        case ItemClass::SKIRT:    return "skirt";
        case ItemClass::DRESS:    return "dress";
        case ItemClass::BAG:      return "bag";
        case ItemClass::SHOE:     return "shoe";
    }
    return "unknown";
}

bool itemClassFromId(int classId, ItemClass& out) {
    if (classId < 0 || classId >= ITEM_CLASS_COUNT) {
        return false;
    }
    out = static_cast<ItemClass>(classId);
    return true;
}

const std::vector<ItemClass>& allItemClasses() {
    static const std::vector<ItemClass> classes = {
        ItemClass::SUNGLASS, ItemClass::HAT, ItemClass::JACKET, ItemClass::SHIRT,
        ItemClass::PANTS, ItemClass::SHORTS, ItemClass::SKIRT, ItemClass::DRESS,
        ItemClass::BAG, ItemClass::SHOE
    };
    return classes;
}

std::string occasionKey(Occasion occasion) {
    return occasionTable().at(occasion).first;
}

std::string occasionDescription(Occasion occasion) {
    return occasionTable().at(occasion).second;
}

bool tryParseOccasion(const std::string& key, Occasion& out) {
    for (const auto& [occasion, names] : occasionTable()) {
        if (names.first == key) {
            out = occasion;
            return true;
        }
    }
    return false;
}

Occasion parseOccasion(const std::string& key) {
    Occasion occasion;
    if (!tryParseOccasion(key, occasion)) {
        throw InvalidOccasionError(key);
    }
    return occasion;
}

const std::vector<Occasion>& allOccasions() {
    static const std::vector<Occasion> occasions = {
        Occasion::JOB_INTERVIEW, Occasion::DATE_NIGHT, Occasion::CASUAL_HANGOUT,
        Occasion::WORK_MEETING, Occasion::FORMAL_EVENT, Occasion::BEACH_VACATION,
        Occasion::NIGHT_OUT, Occasion::BUSINESS_CASUAL
    };
    return occasions;
}

std::string extractionMethodName(ExtractionMethod method) {
    switch (method) {
        case ExtractionMethod::CLUSTERING: return "clustering";
        case ExtractionMethod::PALETTE:    return "palette";
        case ExtractionMethod::SIMPLE:     return "simple";
        case ExtractionMethod::FALLBACK:   return "fallback";
    }
    return "unknown";
}

} // namespace Fitcast
