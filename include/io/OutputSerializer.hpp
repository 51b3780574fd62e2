#ifndef OUTPUT_SERIALIZER_HPP
#define OUTPUT_SERIALIZER_HPP

#include <memory>
#include <string>
#include <vector>
#include "io/ArrayDataset.hpp"
#include "io/CompartmentState.hpp"
#include "io/ObservablesCalculator.hpp"
#include "io/interfaces/IOutputFormat.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @class OutputSerializer
 * @brief Writes the results of a run in the configured array format.
 *
 * Three products are available: the full compartment dump, a single-step
 * snapshot and the daily observables. Each one replaces any file of the same
 * name in the output folder.
 */
class OutputSerializer {
public:
    /**
     * @param format Array format used for every file.
     * @param outputFolder Existing directory receiving the files.
     * @param logger Run logger.
     */
    OutputSerializer(std::unique_ptr<IOutputFormat> format, std::string outputFolder, Logger& logger);

    const IOutputFormat& getFormat() const { return *format_; }
    const std::string& getOutputFolder() const { return outputFolder_; }

    /**
     * @brief Writes `compartments_full<ext>`: one variable per compartment, dims (G, M, T, [V]).
     * @return Path of the written file.
     */
    std::string writeFullDump(const CompartmentState& state) const;

    /**
     * @brief Writes `compartments_t_<date><ext>` holding variable `data` with dims (G, M, [V], epi_states).
     * @param step 1-based step to export.
     * @return Path of the written file.
     * @throws ExportIndexOutOfRangeException If @p step lies outside [1, T].
     */
    std::string writeSnapshot(const CompartmentState& state, int step) const;

    /**
     * @brief Writes `observables<ext>` with new_infected, new_hospitalized and new_deaths, dims (G, M, T).
     * @return Path of the written file.
     */
    std::string writeObservables(const CompartmentState& state, const EpidemicParams& epidemic) const;

    static ArrayDataset buildFullDataset(const CompartmentState& state);
    static ArrayDataset buildSnapshotDataset(const CompartmentState& state, int step);
    static ArrayDataset buildObservablesDataset(const CompartmentState& state, const Observables& observables);

    /// @name Dimension builders shared with the initial-condition writer.
    /// @{
    static Dimension ageDimension(const std::vector<std::string>& labels);
    static Dimension patchDimension(const std::vector<std::string>& ids);
    static Dimension timeDimension(const std::vector<std::string>& dates);
    static Dimension vaccinationDimension(const std::vector<std::string>& labels);
    /** @brief `epi_states` axis holding the first @p count compartment labels. */
    static Dimension compartmentDimension(int count);
    /// @}

private:
    std::string outputPath(const std::string& stem) const;

    std::unique_ptr<IOutputFormat> format_;
    std::string outputFolder_;
    Logger& logger_;
};

} // namespace episim

#endif // OUTPUT_SERIALIZER_HPP
