#ifndef OUTPUT_FORMAT_FACTORY_HPP
#define OUTPUT_FORMAT_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>
#include "io/interfaces/IOutputFormat.hpp"
#include "utils/Logger.hpp"

namespace episim {

/**
 * @class OutputFormatFactory
 * @brief Creates array-file formats by name.
 */
class OutputFormatFactory {
public:
    /**
     * @brief Creates the format registered under @p name ("netcdf" or "hdf5").
     *
     * An unknown name falls back to netcdf; the fallback is logged at debug level.
     *
     * @param name Value of `simulation.output_format` or `simulation.init_format`.
     * @param logger Run logger.
     * @return std::unique_ptr<IOutputFormat> Format instance.
     */
    static std::unique_ptr<IOutputFormat> create(const std::string& name, Logger& logger);

    /** @brief Names accepted by create() without falling back. */
    static std::vector<std::string> knownFormats();
};

} // namespace episim

#endif // OUTPUT_FORMAT_FACTORY_HPP
