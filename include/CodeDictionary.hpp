#ifndef CODE_DICTIONARY_HPP
#define CODE_DICTIONARY_HPP

/**
 * @file CodeDictionary.hpp
 * @brief Read-only mapping from field codes to numeric rating contributions
 *
 * The dictionary is built once, either from the built-in RMR tables or
 * from a CSV table, and cannot be modified afterwards. It is passed
 * explicitly to every component that needs it.
 *
 * CSV table format (header and '#' comments optional):
 *   parameter,code,value[,description]
 *   roughness,1,6,Very rough
 *   spacing,3,130,60-200 mm
 */

#include "RMRS.hpp"
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Dictionary entry: numeric value plus a human-readable label
 */
struct CodeEntry {
    double value;                ///< Rating contribution (mm for SPACING)
    std::string description;

    CodeEntry(double v = 0.0, const std::string& desc = "")
        : value(v), description(desc) {}
};

class CodeDictionary {
public:
    /**
     * @brief Built-in table (Bieniawski RMR ratings, ISRM strength grades)
     */
    static CodeDictionary createDefault();

    /**
     * @brief Load a CSV table
     * @throws std::runtime_error if the file cannot be read or a line is malformed
     */
    static CodeDictionary loadFromFile(const std::string& filename);

    /**
     * @brief Parse a CSV table from a stream
     * @param source_name Name used in error messages
     */
    static CodeDictionary loadFromStream(std::istream& in,
                                         const std::string& source_name = "<stream>");

    /**
     * @brief Rating (or spacing in mm) for a code
     * @throws UnknownCodeError if the code has no entry for the parameter
     */
    double ratingFor(RatingParameter parameter, const std::string& code) const;

    bool hasCode(RatingParameter parameter, const std::string& code) const;

    /**
     * @brief Entry lookup
     * @return Pointer to the entry, or nullptr if absent
     */
    const CodeEntry* getEntry(RatingParameter parameter, const std::string& code) const;

    /// Codes known for a parameter, sorted
    std::vector<std::string> getCodes(RatingParameter parameter) const;

    /// Total number of entries
    size_t size() const;

    /**
     * @brief Normalised form of a field code
     *
     * Trimmed, upper-cased, and "3.0" reduced to "3". Lookups and stored
     * records both use this form.
     */
    static std::string canonicalCode(const std::string& code);

    /// Write the table in the CSV format accepted by loadFromStream
    void writeTable(std::ostream& out) const;

private:
    using Table = std::map<RatingParameter, std::map<std::string, CodeEntry>>;

    explicit CodeDictionary(Table table);

    Table table_;
};

} // namespace RMRS

#endif // CODE_DICTIONARY_HPP
