#pragma once

#include "../core/Types.h"

#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace accessroute {

/// POI catalog file missing or unreadable
class PoiLoadError : public std::runtime_error {
public:
    explicit PoiLoadError(const std::string& message) : std::runtime_error(message) {}
};

/// Category for entries that appear before any section header
constexpr const char* UNCATEGORIZED = "Uncategorized";

struct PointOfInterest {
    std::string name;
    std::string category;
    GeoPoint position;
    size_t lineNumber = 0;
};

/// A catalog line that was not loaded
struct SkippedLine {
    size_t lineNumber = 0;
    std::string text;
    std::string reason;
};

/// Named campus locations grouped by category.
///
/// Text format (UTF-8, optional BOM):
/// @code
/// ---Blocos Didáticos---
/// Bloco 901: -3.7456, -38.5743
/// Reitoria: Prédio Principal: -3.7441, -38.5760
/// @endcode
/// The name is everything before the last ':'. Blank lines are ignored.
/// Malformed lines and duplicate names are skipped and listed in skipped().
class PoiCatalog {
public:
    PoiCatalog() = default;

    /// @throws PoiLoadError if the file cannot be opened
    static PoiCatalog loadFromFile(const std::string& path);

    static PoiCatalog parse(std::istream& in);
    static PoiCatalog parseString(const std::string& text);

    const std::vector<PointOfInterest>& entries() const { return entries_; }

    /// Names of categories holding at least one entry, in file order
    const std::vector<std::string>& categories() const { return categories_; }

    std::vector<const PointOfInterest*> inCategory(const std::string& category) const;

    /// @return Entry with @p name, or nullptr
    const PointOfInterest* find(const std::string& name) const;

    const std::vector<SkippedLine>& skipped() const { return skipped_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void addCategory(const std::string& category);
    void skip(size_t lineNumber, const std::string& text, std::string reason);
    void parseEntry(size_t lineNumber, const std::string& line, const std::string& category);

    std::vector<PointOfInterest> entries_;
    std::vector<std::string> categories_;
    std::unordered_map<std::string, size_t> byName_;
    std::vector<SkippedLine> skipped_;
};

}  // namespace accessroute
