#include "io/OutputSerializer.hpp"
#include "utils/DateUtils.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"

namespace episim {

namespace {

std::vector<double> flatten(const ObservableArray& array) {
    return std::vector<double>(array.data(), array.data() + array.size());
}

std::vector<std::string> spatialDimensions(bool withTime, bool withVaccination) {
    std::vector<std::string> dims = {"G", "M"};
    if (withTime) dims.push_back("T");
    if (withVaccination) dims.push_back("V");
    return dims;
}

} // namespace

OutputSerializer::OutputSerializer(std::unique_ptr<IOutputFormat> format, std::string outputFolder, Logger& logger)
    : format_(std::move(format)), outputFolder_(std::move(outputFolder)), logger_(logger)
{
    if (!format_) {
        THROW_INVALID_PARAM("OutputSerializer::OutputSerializer", "output format cannot be null");
    }
}

Dimension OutputSerializer::ageDimension(const std::vector<std::string>& labels) {
    return Dimension{"G", labels, "Age strata"};
}

Dimension OutputSerializer::patchDimension(const std::vector<std::string>& ids) {
    return Dimension{"M", ids, "Region"};
}

Dimension OutputSerializer::timeDimension(const std::vector<std::string>& dates) {
    return Dimension{"T", dates, "Time"};
}

Dimension OutputSerializer::vaccinationDimension(const std::vector<std::string>& labels) {
    return Dimension{"V", labels, "Vaccination status"};
}

Dimension OutputSerializer::compartmentDimension(int count) {
    if (count < 1 || count > constants::NUM_COMPARTMENTS) {
        THROW_INVALID_PARAM("OutputSerializer::compartmentDimension",
                            "compartment count must lie in [1, " + std::to_string(constants::NUM_COMPARTMENTS) + "]");
    }
    std::vector<std::string> labels(constants::COMPARTMENT_LABELS.begin(),
                                    constants::COMPARTMENT_LABELS.begin() + count);
    return Dimension{"epi_states", labels, "Epidemic compartment"};
}

ArrayDataset OutputSerializer::buildFullDataset(const CompartmentState& state) {
    ArrayDataset dataset;
    dataset.addDimension(ageDimension(state.getAgeLabels()));
    dataset.addDimension(patchDimension(state.getPatchIds()));
    dataset.addDimension(timeDimension(state.getDateLabels()));
    if (state.hasVaccinationAxis()) {
        dataset.addDimension(vaccinationDimension(state.getVaccinationLabels()));
    }

    const std::vector<std::string> dims = spatialDimensions(true, state.hasVaccinationAxis());
    for (int c = 0; c < constants::NUM_COMPARTMENTS; ++c) {
        const CompartmentArray& counts = state.counts(static_cast<Compartment>(c));
        Variable var;
        var.name = constants::COMPARTMENT_LABELS[static_cast<size_t>(c)];
        var.dimensions = dims;
        var.description = constants::COMPARTMENT_DESCRIPTIONS[static_cast<size_t>(c)];
        // Row-major (G, M, T, V); with V = 1 this is also the (G, M, T) layout.
        var.values.assign(counts.data(), counts.data() + counts.size());
        dataset.addVariable(std::move(var));
    }
    return dataset;
}

ArrayDataset OutputSerializer::buildSnapshotDataset(const CompartmentState& state, int step) {
    const int T = state.getNumSteps();
    if (step < 1 || step > T) {
        THROW_EXPORT_OUT_OF_RANGE("OutputSerializer::buildSnapshotDataset",
            "time step " + std::to_string(step) + " is outside [1, " + std::to_string(T) + "]");
    }
    const int t = step - 1;
    const int G = state.getNumAgeGroups();
    const int M = state.getNumPatches();
    const int V = state.getNumVaccinationStatuses();
    const int S = constants::NUM_COMPARTMENTS;

    ArrayDataset dataset;
    dataset.addDimension(ageDimension(state.getAgeLabels()));
    dataset.addDimension(patchDimension(state.getPatchIds()));
    if (state.hasVaccinationAxis()) {
        dataset.addDimension(vaccinationDimension(state.getVaccinationLabels()));
    }
    dataset.addDimension(compartmentDimension(S));

    Variable var;
    var.name = "data";
    var.dimensions = spatialDimensions(false, state.hasVaccinationAxis());
    var.dimensions.push_back("epi_states");
    var.description = "Compartment counts on " + state.getDateLabels()[static_cast<size_t>(t)];
    var.values.reserve(static_cast<size_t>(G) * M * V * S);
    for (int g = 0; g < G; ++g) {
        for (int m = 0; m < M; ++m) {
            for (int v = 0; v < V; ++v) {
                for (int c = 0; c < S; ++c) {
                    var.values.push_back(state.counts(static_cast<Compartment>(c))(g, m, t, v));
                }
            }
        }
    }
    dataset.addVariable(std::move(var));
    return dataset;
}

ArrayDataset OutputSerializer::buildObservablesDataset(const CompartmentState& state, const Observables& observables) {
    ArrayDataset dataset;
    dataset.addDimension(ageDimension(state.getAgeLabels()));
    dataset.addDimension(patchDimension(state.getPatchIds()));
    dataset.addDimension(timeDimension(state.getDateLabels()));

    const std::vector<std::string> dims = {"G", "M", "T"};
    dataset.addVariable(Variable{"new_infected", dims, "Daily infections", flatten(observables.newInfected)});
    dataset.addVariable(Variable{"new_hospitalized", dims, "Daily hospitalizations", flatten(observables.newHospitalized)});
    dataset.addVariable(Variable{"new_deaths", dims, "Daily deaths", flatten(observables.newDeaths)});
    return dataset;
}

std::string OutputSerializer::writeFullDump(const CompartmentState& state) const {
    const std::string path = outputPath("compartments_full");
    logger_.info("OutputSerializer::writeFullDump", "Storing full simulation output: " + path);
    format_->write(path, buildFullDataset(state));
    return path;
}

std::string OutputSerializer::writeSnapshot(const CompartmentState& state, int step) const {
    ArrayDataset dataset = buildSnapshotDataset(state, step);
    const std::string date = DateUtils::formatDate(DateUtils::dateOfStep(state.getStartDate(), step));
    const std::string path = outputPath("compartments_t_" + date);
    logger_.info("OutputSerializer::writeSnapshot", "Storing compartments at step " + std::to_string(step) + ": " + path);
    format_->write(path, dataset);
    return path;
}

std::string OutputSerializer::writeObservables(const CompartmentState& state, const EpidemicParams& epidemic) const {
    const std::string path = outputPath("observables");
    logger_.info("OutputSerializer::writeObservables", "Storing simulation observables: " + path);
    format_->write(path, buildObservablesDataset(state, ObservablesCalculator::compute(state, epidemic)));
    return path;
}

std::string OutputSerializer::outputPath(const std::string& stem) const {
    return FileUtils::joinPaths(outputFolder_, stem + format_->getFileExtension());
}

} // namespace episim
