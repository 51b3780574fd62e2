#include <iostream>
#include <string>
#include <vector>

#include "app/EpiSimRunner.hpp"
#include "utils/Logger.hpp"

using namespace std;
using namespace episim;

void printUsage(const char* programName) {
    cout << "Usage: " << programName << " <command> [options]" << endl;
    cout << "Commands:" << endl;
    cout << "  run    Run an epidemic simulation" << endl;
    cout << "         --config, -c <file>                  Config file (JSON, required)" << endl;
    cout << "         --data-folder, -d <dir>              Data folder (required)" << endl;
    cout << "         --instance-folder, -i <dir>          Instance folder (default: .)" << endl;
    cout << "         --initial-condition <file>           Initial compartments; seeds are used when missing" << endl;
    cout << "         --start-date <YYYY-MM-DD>            Overrides simulation.start_date" << endl;
    cout << "         --end-date <YYYY-MM-DD>              Overrides simulation.end_date" << endl;
    cout << "         --export-compartments-time-t <N>     Export compartments at step N (1-based)" << endl;
    cout << "         --export-compartments-full           Export compartments for every step" << endl;
    cout << "         --dry-run                            Hold the initial state instead of integrating" << endl;
    cout << "  setup  Create a model template (config and empty data files)" << endl;
    cout << "         --name, -n <name>                    Model name (required)" << endl;
    cout << "         --metapop, -M <count>                Number of patches (required)" << endl;
    cout << "         --agents, -G <count>                 Number of age strata (required)" << endl;
    cout << "         --output, -o <dir>                   Parent folder (default: models)" << endl;
    cout << "         --engine, -e <id>                    Engine (default: MMCACovid19Vac)" << endl;
    cout << "  init   Create an initial condition file from seeds" << endl;
    cout << "         --config, -c <file>                  Config file (JSON, required)" << endl;
    cout << "         --data-folder, -d <dir>              Data folder (required)" << endl;
    cout << "         --seeds <file>                       CSV with columns idx and seed (required)" << endl;
    cout << "         --output, -o <file>                  Output name (default: initial_conditions.nc)" << endl;
    cout << "Common options:" << endl;
    cout << "  --log-level, -l <level>   debug, info, warn, error or silent (default: info)" << endl;
    cout << "  --log-file <file>         Also write log messages to a file" << endl;
    cout << "  --help, -h                Show this help message" << endl;
}

namespace {

/// Value following option @p i; advances @p i.
bool nextValue(const vector<string>& args, size_t& i, string& value) {
    if (i + 1 >= args.size()) {
        cerr << "Error: " << args[i] << " requires a value" << endl;
        return false;
    }
    value = args[++i];
    return true;
}

bool parseInt(const string& option, const string& text, int& value) {
    size_t consumed = 0;
    try {
        value = stoi(text, &consumed);
    } catch (const exception&) {
        consumed = 0;
    }
    if (!text.empty() && consumed == text.size()) {
        return true;
    }
    cerr << "Error: " << option << " expects an integer, got '" << text << "'" << endl;
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    vector<string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage(argv[0]);
        return args.empty() ? 1 : 0;
    }

    const string command = args[0];
    if (command != "run" && command != "setup" && command != "init") {
        cerr << "Error: unknown command '" << command << "'" << endl;
        printUsage(argv[0]);
        return 1;
    }

    RunOptions runOptions;
    SetupOptions setupOptions;
    InitOptions initOptions;
    string logLevel = "info";
    string logFile;

    // === COMMAND LINE PARSING ===
    for (size_t i = 1; i < args.size(); ++i) {
        const string& arg = args[i];
        string value;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--log-level" || arg == "-l") {
            if (!nextValue(args, i, logLevel)) return 1;
        } else if (arg == "--log-file") {
            if (!nextValue(args, i, logFile)) return 1;
        } else if (command == "run") {
            if (arg == "--config" || arg == "-c") {
                if (!nextValue(args, i, runOptions.configPath)) return 1;
            } else if (arg == "--data-folder" || arg == "-d") {
                if (!nextValue(args, i, runOptions.dataFolder)) return 1;
            } else if (arg == "--instance-folder" || arg == "-i") {
                if (!nextValue(args, i, runOptions.instanceFolder)) return 1;
            } else if (arg == "--initial-condition") {
                if (!nextValue(args, i, value)) return 1;
                runOptions.overrides.initialConditionPath = value;
            } else if (arg == "--start-date") {
                if (!nextValue(args, i, value)) return 1;
                runOptions.overrides.startDate = value;
            } else if (arg == "--end-date") {
                if (!nextValue(args, i, value)) return 1;
                runOptions.overrides.endDate = value;
            } else if (arg == "--export-compartments-time-t") {
                int step = 0;
                if (!nextValue(args, i, value) || !parseInt(arg, value, step)) return 1;
                runOptions.overrides.exportTimeStep = step;
            } else if (arg == "--export-compartments-full") {
                runOptions.overrides.exportFull = true;
            } else if (arg == "--dry-run") {
                runOptions.dryRun = true;
            } else {
                cerr << "Error: unknown option for run: " << arg << endl;
                return 1;
            }
        } else if (command == "setup") {
            if (arg == "--name" || arg == "-n") {
                if (!nextValue(args, i, setupOptions.name)) return 1;
            } else if (arg == "--metapop" || arg == "-M") {
                if (!nextValue(args, i, value) || !parseInt(arg, value, setupOptions.patches)) return 1;
            } else if (arg == "--agents" || arg == "-G") {
                if (!nextValue(args, i, value) || !parseInt(arg, value, setupOptions.ageGroups)) return 1;
            } else if (arg == "--output" || arg == "-o") {
                if (!nextValue(args, i, setupOptions.outputFolder)) return 1;
            } else if (arg == "--engine" || arg == "-e") {
                if (!nextValue(args, i, setupOptions.engineId)) return 1;
            } else {
                cerr << "Error: unknown option for setup: " << arg << endl;
                return 1;
            }
        } else {
            if (arg == "--config" || arg == "-c") {
                if (!nextValue(args, i, initOptions.configPath)) return 1;
            } else if (arg == "--data-folder" || arg == "-d") {
                if (!nextValue(args, i, initOptions.dataFolder)) return 1;
            } else if (arg == "--seeds") {
                if (!nextValue(args, i, initOptions.seedsPath)) return 1;
            } else if (arg == "--output" || arg == "-o") {
                if (!nextValue(args, i, initOptions.outputFilename)) return 1;
            } else {
                cerr << "Error: unknown option for init: " << arg << endl;
                return 1;
            }
        }
    }

    Logger& logger = Logger::getInstance();
    logger.setLogLevel(parseLogLevel(logLevel));
    if (!logFile.empty() && !logger.enableFileLogging(true, logFile)) {
        return 1;
    }

    EpiSimRunner runner(logger);

    if (command == "run") {
        if (runOptions.configPath.empty() || runOptions.dataFolder.empty()) {
            cerr << "Error: run requires --config and --data-folder" << endl;
            return 1;
        }
        return runner.executeRun(runOptions);
    }
    if (command == "setup") {
        if (setupOptions.name.empty() || setupOptions.patches <= 0 || setupOptions.ageGroups <= 0) {
            cerr << "Error: setup requires --name, --metapop and --agents (positive)" << endl;
            return 1;
        }
        return runner.executeSetup(setupOptions);
    }
    if (initOptions.configPath.empty() || initOptions.dataFolder.empty() || initOptions.seedsPath.empty()) {
        cerr << "Error: init requires --config, --data-folder and --seeds" << endl;
        return 1;
    }
    return runner.executeInit(initOptions);
}
