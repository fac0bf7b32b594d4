#include "vision/template_library.hpp"
#include "rampart_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static constexpr const char* TAG = "TplLib";

namespace rampart::vision {

namespace {

bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

struct ManifestEntry {
    std::string category;
    std::optional<float> threshold;
};

// name -> overrides; a missing or malformed manifest simply yields nothing
std::map<std::string, ManifestEntry> readManifest(const fs::path& path) {
    std::map<std::string, ManifestEntry> out;
    std::ifstream in(path);
    if (!in.is_open()) return out;
    try {
        auto j = nlohmann::json::parse(in);
        for (const auto& t : j.value("templates", nlohmann::json::array())) {
            std::string file = t.value("file", std::string());
            std::string name = t.value("name", fs::path(file).stem().string());
            if (name.empty()) continue;
            ManifestEntry entry{t.value("category", std::string("card")), std::nullopt};
            if (t.contains("threshold") && t["threshold"].is_number()) {
                entry.threshold = t["threshold"].get<float>();
            }
            out[name] = entry;
        }
    } catch (const nlohmann::json::exception& e) {
        RLOG_ERROR(TAG, "manifest %s: %s", path.string().c_str(), e.what());
    }
    return out;
}

} // anonymous namespace

Result<size_t> TemplateLibrary::loadDirectory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<size_t>("template directory not found: " + dir, ErrorCode::IoError);
    }

    auto manifest = readManifest(fs::path(dir) / "manifest.json");
    std::vector<UnitTemplate> loaded;

    for (auto it = fs::recursive_directory_iterator(dir, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file() || !isImageFile(it->path())) continue;

        auto img = loadImageFile(it->path().string());
        if (!img) continue;

        UnitTemplate t;
        t.name = it->path().stem().string();
        t.gray = toGray(img.value());
        if (it.depth() > 0) t.category = it->path().parent_path().filename().string();

        auto m = manifest.find(t.name);
        if (m != manifest.end()) {
            t.category = m->second.category;
            t.threshold = m->second.threshold;
        }
        loaded.push_back(std::move(t));
    }
    if (ec) {
        return Err<size_t>("cannot read " + dir + ": " + ec.message(), ErrorCode::IoError);
    }

    std::sort(loaded.begin(), loaded.end(),
              [](const UnitTemplate& a, const UnitTemplate& b) { return a.name < b.name; });
    templates_ = std::move(loaded);
    RLOG_INFO(TAG, "Loaded %zu template(s) from %s", templates_.size(), dir.c_str());
    return templates_.size();
}

std::optional<TemplateLibrary::Hit> TemplateLibrary::bestMatch(const Gray8& cell,
                                                               const std::string& category,
                                                               float default_threshold) const {
    if (cell.empty()) return std::nullopt;

    std::optional<Hit> best;
    for (const auto& t : templates_) {
        if (t.category != category || t.gray.empty()) continue;
        Gray8 scaled = resize(t.gray, cell.w, cell.h);
        float score = correlationCoefficient(cell, scaled);
        if (score >= t.threshold.value_or(default_threshold) && (!best || score > best->score)) {
            best = Hit{t.name, score};
        }
    }
    return best;
}

} // namespace rampart::vision
