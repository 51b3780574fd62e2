#include "io/OutputFormatFactory.hpp"
#include "io/NetCDFOutputFormat.hpp"
#include "io/Hdf5OutputFormat.hpp"
#include "model/ModelConstants.hpp"

namespace episim {

std::unique_ptr<IOutputFormat> OutputFormatFactory::create(const std::string& name, Logger& logger) {
    if (name == "hdf5") {
        return std::make_unique<Hdf5OutputFormat>();
    }
    if (name != "netcdf") {
        logger.debug("OutputFormatFactory::create",
                     "Unknown format '" + name + "', using " + constants::DEFAULT_OUTPUT_FORMAT);
    }
    return std::make_unique<NetCDFOutputFormat>();
}

std::vector<std::string> OutputFormatFactory::knownFormats() {
    return {"netcdf", "hdf5"};
}

} // namespace episim
