#ifndef PVSIGNAL_FUSION_RESULT_WRITER_HPP
#define PVSIGNAL_FUSION_RESULT_WRITER_HPP

#include "pvsignal/ResultTypes.hpp"
#include "pvsignal/fusion/BatchSummary.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pvsignal {

/**
 * @brief Flat CSV export of scored batches
 *
 * One row per pair. Absent sub-results leave their columns empty;
 * error-marked pairs carry the error kind, component and message.
 */
class FusionResultWriter {
public:
    FusionResultWriter() = default;

    void writeCsv(std::ostream& out, const std::vector<FusionResult>& results) const;

    /**
     * @brief Write the results to a file
     * @return false if the file could not be opened (logged as an error)
     */
    bool saveCsv(const std::string& filepath, const std::vector<FusionResult>& results) const;

    void writeSummary(std::ostream& out, const BatchStatistics& stats) const;

    bool saveSummary(const std::string& filepath, const BatchStatistics& stats) const;

    /**
     * @brief Quote a field if it contains a separator, quote or newline
     */
    static std::string escapeField(const std::string& field);
};

} // namespace pvsignal

#endif // PVSIGNAL_FUSION_RESULT_WRITER_HPP
