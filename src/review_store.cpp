// review_store.cpp
// Held documents on disk between runs.

#include "ztredact/review_store.h"

#include "ztredact/errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ztredact {

// processing ids are hex; anything else never names a file
static bool valid_id(const std::string &id) {
    return !id.empty() && id.size() <= 64 &&
           std::all_of(id.begin(), id.end(), [](char c){ return std::isalnum((unsigned char)c); });
}

ReviewStore::ReviewStore(std::string dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw ConfigError("cannot create review store " + dir_ + ": " + ec.message());
}

std::string ReviewStore::path_for(const std::string &id) const {
    return (fs::path(dir_) / (id + ".json")).string();
}

void ReviewStore::save(const ProcessingRecord &record, const std::string &sanitized_text) const {
    if (!valid_id(record.id())) throw Error("invalid processing id for review store");
    json entry;
    entry["record"] = record.to_json();
    entry["sanitized_text"] = sanitized_text;

    // write then rename, so a reader never sees half an entry
    std::string target = path_for(record.id());
    std::string tmp = target + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw Error("cannot write review entry " + record.id());
        f << entry.dump();
        if (!f) throw Error("cannot write review entry " + record.id());
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw Error("cannot store review entry " + record.id());
    }
}

std::optional<HeldEntry> ReviewStore::load(const std::string &id) const {
    if (!valid_id(id)) return std::nullopt;
    std::ifstream f(path_for(id), std::ios::binary);
    if (!f) return std::nullopt;
    json entry;
    try {
        entry = json::parse(std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>()));
        ProcessingRecord rec = ProcessingRecord::restore_held(entry.at("record"));
        if (rec.id() != id) throw Error("review entry " + id + " holds " + rec.id());
        return HeldEntry{std::move(rec), entry.at("sanitized_text").get<std::string>()};
    } catch (const json::exception &) {
        throw Error("corrupt review entry " + id);
    }
}

void ReviewStore::remove(const std::string &id) const {
    if (!valid_id(id)) return;
    std::error_code ec;
    fs::remove(path_for(id), ec);
}

std::vector<std::string> ReviewStore::ids() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path &p = it->path();
        if (p.extension() != ".json") continue;
        std::string id = p.stem().string();
        if (valid_id(id)) out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace ztredact
