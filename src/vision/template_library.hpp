#pragma once
// =============================================================================
// TemplateLibrary - grayscale unit templates for the fallback matcher
// =============================================================================
// Layout of templates_dir:
//   <category>/<name>.png        category taken from the sub-directory
//   <name>.png                   top-level files are category "card"
//   manifest.json (optional)     {"templates":[{"name","file","category","threshold"}]}
// =============================================================================

#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "vision/image.hpp"

namespace rampart::vision {

struct UnitTemplate {
    std::string name;
    std::string category = "card";
    Gray8 gray;
    std::optional<float> threshold;   // manifest override; unset uses the caller's default
};

class TemplateLibrary {
public:
    struct Hit {
        std::string name;
        float score = 0.0f;
    };

    Result<size_t> loadDirectory(const std::string& dir);
    void add(UnitTemplate t) { templates_.push_back(std::move(t)); }

    // Best template of `category` whose score (template resized to the cell)
    // reaches its own threshold, or `default_threshold` when it has none
    std::optional<Hit> bestMatch(const Gray8& cell, const std::string& category,
                                 float default_threshold) const;

    size_t size() const { return templates_.size(); }
    const std::vector<UnitTemplate>& templates() const { return templates_; }

private:
    std::vector<UnitTemplate> templates_;
};

} // namespace rampart::vision
