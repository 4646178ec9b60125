#include "RMRS.hpp"
#include "CodeDictionary.hpp"
#include "ConfigReader.hpp"
#include "DiscontinuityIO.hpp"
#include "RmrAnalysis.hpp"
#include <petsc.h>
#include <iostream>
#include <string>
#include <vector>

static char help[] = "RMRS - Rock Mass Rating and discontinuity family analysis\n"
                    "Usage: rmrs [options]\n\n"
                    "Options:\n"
                    "  -c <file>                   Configuration file (.config)\n"
                    "  -data <file>                Discontinuity CSV (overrides [INPUT] data_file)\n"
                    "  -dictionary <file>          Code dictionary CSV (default: built-in table)\n"
                    "  -o <prefix>                 Output prefix (overrides [OUTPUT] path)\n"
                    "  -ucs_class <code>           Default strength class, e.g. R4\n"
                    "  -orientation_adjustment <v> Orientation penalty (<= 0)\n"
                    "  -tolerance <deg>            Family clustering tolerance\n"
                    "  -min_members <n>            Minimum family size\n"
                    "  -metric <name>              TWO_THRESHOLD or GREAT_CIRCLE\n\n"
                    "Examples:\n"
                    "  # Score stations and families from a configuration file\n"
                    "  mpirun -np 4 rmrs -c config/example_traverse.config\n\n"
                    "  # Data file only, built-in dictionary\n"
                    "  rmrs -data survey.csv -ucs_class R3 -o output/survey\n\n"
                    "  # Generate template configuration\n"
                    "  rmrs -generate_config my_config.config\n\n";

// Collect each rank's rows on rank 0, grouped by rank
static std::vector<std::vector<std::string>> gatherRows(MPI_Comm comm,
                                                        const std::vector<std::string>& local) {
    int rank, size;
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);

    std::string buffer;
    for (const auto& row : local) {
        buffer += row;
        buffer.push_back('\0');
    }
    int local_len = static_cast<int>(buffer.size());

    std::vector<int> lengths(size, 0);
    MPI_Gather(&local_len, 1, MPI_INT, lengths.data(), 1, MPI_INT, 0, comm);

    std::vector<int> displs(size, 0);
    std::vector<char> all;
    if (rank == 0) {
        int total = 0;
        for (int r = 0; r < size; ++r) {
            displs[r] = total;
            total += lengths[r];
        }
        all.resize(total > 0 ? total : 1);
    }

    MPI_Gatherv(buffer.data(), local_len, MPI_CHAR,
                all.data(), lengths.data(), displs.data(), MPI_CHAR, 0, comm);

    std::vector<std::vector<std::string>> per_rank(size);
    if (rank == 0) {
        for (int r = 0; r < size; ++r) {
            int pos = displs[r];
            int end = displs[r] + lengths[r];
            while (pos < end) {
                std::string row(&all[pos]);
                pos += static_cast<int>(row.size()) + 1;
                per_rank[r].push_back(row);
            }
        }
    }
    return per_rank;
}

// Undo the round-robin distribution: unit i was handled by rank i % size
static std::vector<std::string> interleave(const std::vector<std::vector<std::string>>& per_rank,
                                           size_t count) {
    std::vector<std::string> rows;
    const size_t size = per_rank.size();
    for (size_t i = 0; i < count; ++i) {
        const auto& rank_rows = per_rank[i % size];
        size_t slot = i / size;
        if (slot < rank_rows.size() && !rank_rows[slot].empty()) {
            rows.push_back(rank_rows[slot]);
        }
    }
    return rows;
}

static std::vector<std::string> concatenate(const std::vector<std::vector<std::string>>& per_rank) {
    std::vector<std::string> rows;
    for (const auto& rank_rows : per_rank) {
        rows.insert(rows.end(), rank_rows.begin(), rank_rows.end());
    }
    return rows;
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank, size;
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &size);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            int status = 0;
            if (rank == 0) {
                try {
                    RMRS::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                    PetscPrintf(comm, "Edit this file to customize your analysis.\n");
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    status = 1;
                }
            }
            ierr = PetscFinalize();
            return status;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char data_file[PETSC_MAX_PATH_LEN] = "";
        char dictionary_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char ucs_class[64] = "";
        char metric[64] = "";
        PetscReal orientation_adjustment = 0.0;
        PetscReal tolerance = 0.0;
        PetscInt min_members = 0;
        PetscBool config_provided = PETSC_FALSE;
        PetscBool data_provided = PETSC_FALSE;
        PetscBool dictionary_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool ucs_provided = PETSC_FALSE;
        PetscBool metric_provided = PETSC_FALSE;
        PetscBool adjustment_provided = PETSC_FALSE;
        PetscBool tolerance_provided = PETSC_FALSE;
        PetscBool min_members_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-data", data_file,
                                     sizeof(data_file), &data_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-dictionary", dictionary_file,
                                     sizeof(dictionary_file), &dictionary_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-ucs_class", ucs_class,
                                     sizeof(ucs_class), &ucs_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-metric", metric,
                                     sizeof(metric), &metric_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-orientation_adjustment",
                                   &orientation_adjustment, &adjustment_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-tolerance", &tolerance,
                                   &tolerance_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-min_members", &min_members,
                                  &min_members_provided); CHKERRQ(ierr);

        if (!config_provided && !data_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) or data file (-data) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: rmrs -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        try {
            // Configuration file, then command-line overrides
            RMRS::ConfigReader config;
            if (config_provided && !config.loadFile(config_file)) {
                throw std::runtime_error(std::string("Cannot read configuration file: ") + config_file);
            }
            if (data_provided) config.set("INPUT", "data_file", data_file);
            if (dictionary_provided) config.set("INPUT", "dictionary_file", dictionary_file);
            if (output_provided) config.set("OUTPUT", "path", output_prefix);
            if (ucs_provided) config.set("ANALYSIS", "ucs_class", ucs_class);
            if (metric_provided) config.set("CLUSTERING", "metric", metric);
            if (adjustment_provided) {
                config.set("ANALYSIS", "orientation_adjustment",
                           std::to_string(static_cast<double>(orientation_adjustment)));
            }
            if (tolerance_provided) {
                config.set("CLUSTERING", "tolerance", std::to_string(static_cast<double>(tolerance)));
            }
            if (min_members_provided) {
                config.set("CLUSTERING", "min_members", std::to_string(static_cast<long>(min_members)));
            }

            RMRS::ConfigReader::ValidationResult validation = config.validate();
            if (rank == 0) {
                for (const auto& w : validation.warnings) {
                    PetscPrintf(comm, "Warning: %s\n", w.c_str());
                }
                for (const auto& e : validation.errors) {
                    PetscPrintf(comm, "Error: %s\n", e.c_str());
                }
            }
            if (!validation.valid) {
                throw std::runtime_error("Invalid configuration");
            }

            RMRS::ConfigReader::AnalysisConfig analysis_cfg;
            RMRS::ConfigReader::InputConfig input_cfg;
            RMRS::ConfigReader::OutputConfig output_cfg;
            config.parseAnalysisConfig(analysis_cfg);
            config.parseInputConfig(input_cfg);
            config.parseOutputConfig(output_cfg);

            if (input_cfg.data_file.empty()) {
                throw std::runtime_error("No discontinuity data file given");
            }

            if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "  RMRS - Rock Mass Rating and Discontinuity Families\n");
                PetscPrintf(comm, "  Project: %s\n", analysis_cfg.project_name.c_str());
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "\n");
                if (config_provided) {
                    PetscPrintf(comm, "Config file:   %s\n", config_file);
                }
                PetscPrintf(comm, "Data file:     %s\n", input_cfg.data_file.c_str());
                PetscPrintf(comm, "Dictionary:    %s\n", input_cfg.dictionary_file.empty()
                                                             ? "built-in"
                                                             : input_cfg.dictionary_file.c_str());
                PetscPrintf(comm, "Output prefix: %s\n", output_cfg.base_path.c_str());
                PetscPrintf(comm, "Processes:     %d\n", size);
                PetscPrintf(comm, "\n");
            }

            RMRS::CodeDictionary dictionary = input_cfg.dictionary_file.empty()
                ? RMRS::CodeDictionary::createDefault()
                : RMRS::CodeDictionary::loadFromFile(input_cfg.dictionary_file);

            RMRS::RecordTable table = RMRS::DiscontinuityIO::readRecords(input_cfg.data_file);

            RMRS::AnalysisSettings settings = RMRS::AnalysisSettings::fromConfig(config);
            RMRS::RmrAnalysis analysis(dictionary, settings);
            analysis.prepare(table.records, table.errors);

            if (rank == 0) {
                PetscPrintf(comm, "Records read:      %d (%d valid)\n",
                            static_cast<int>(table.records.size() + table.errors.size()),
                            static_cast<int>(analysis.validDiscontinuities().size()));
                PetscPrintf(comm, "Stations:          %d\n", static_cast<int>(analysis.stationCount()));
                PetscPrintf(comm, "Families:          %d (tolerance %.1f deg, min %d members, %s)\n",
                            static_cast<int>(analysis.familyCount()),
                            settings.clustering.tolerance, settings.clustering.min_members,
                            RMRS::toString(settings.clustering.metric).c_str());
                PetscPrintf(comm, "Unclustered:       %d\n", static_cast<int>(analysis.unclustered().size()));
                PetscPrintf(comm, "\nScoring...\n");
            }

            double start_time = MPI_Wtime();

            // Round-robin over ranks; failed units leave an empty slot
            std::vector<std::string> station_rows, family_rows, failure_rows;
            std::vector<double> local_totals;

            for (size_t i = static_cast<size_t>(rank); i < analysis.stationCount(); i += size) {
                RMRS::StationResult result = analysis.scoreStation(i);
                if (result.ok()) {
                    station_rows.push_back(RMRS::DiscontinuityIO::stationRow(*result.score));
                    local_totals.push_back(result.score->total);
                } else {
                    station_rows.push_back("");
                    failure_rows.push_back(RMRS::DiscontinuityIO::errorRow(*result.failure));
                }
            }

            for (size_t i = static_cast<size_t>(rank); i < analysis.familyCount(); i += size) {
                RMRS::FamilyResult result = analysis.scoreFamily(i);
                if (result.ok()) {
                    family_rows.push_back(RMRS::DiscontinuityIO::familyRow(*result.summary));
                } else {
                    family_rows.push_back("");
                    failure_rows.push_back(RMRS::DiscontinuityIO::errorRow(*result.failure));
                }
            }

            auto all_stations = interleave(gatherRows(comm, station_rows), analysis.stationCount());
            auto all_families = interleave(gatherRows(comm, family_rows), analysis.familyCount());
            auto all_failures = concatenate(gatherRows(comm, failure_rows));

            // Station totals for the project summary
            int local_count = static_cast<int>(local_totals.size());
            std::vector<int> counts(size, 0);
            MPI_Gather(&local_count, 1, MPI_INT, counts.data(), 1, MPI_INT, 0, comm);
            std::vector<int> displs(size, 0);
            std::vector<double> totals;
            if (rank == 0) {
                int n = 0;
                for (int r = 0; r < size; ++r) {
                    displs[r] = n;
                    n += counts[r];
                }
                totals.resize(n > 0 ? n : 1);
            }
            MPI_Gatherv(local_totals.data(), local_count, MPI_DOUBLE,
                        totals.data(), counts.data(), displs.data(), MPI_DOUBLE, 0, comm);

            double end_time = MPI_Wtime();

            if (rank == 0) {
                totals.resize(all_stations.size());
                RMRS::ProjectSummary summary = analysis.summarize(totals);

                const std::string& prefix = output_cfg.base_path;
                if (output_cfg.write_stations) {
                    RMRS::DiscontinuityIO::writeTable(prefix + "_stations.csv",
                        RMRS::DiscontinuityIO::stationHeader(), all_stations);
                }
                if (output_cfg.write_families) {
                    RMRS::DiscontinuityIO::writeTable(prefix + "_families.csv",
                        RMRS::DiscontinuityIO::familyHeader(), all_families);
                }
                if (output_cfg.write_unclustered) {
                    std::vector<std::string> rows;
                    for (const auto& d : analysis.unclustered()) {
                        rows.push_back(RMRS::DiscontinuityIO::unclusteredRow(d));
                    }
                    RMRS::DiscontinuityIO::writeTable(prefix + "_unclustered.csv",
                        RMRS::DiscontinuityIO::unclusteredHeader(), rows);
                }
                if (output_cfg.write_errors) {
                    std::vector<std::string> rows;
                    for (const auto& e : analysis.recordErrors()) {
                        rows.push_back(RMRS::DiscontinuityIO::errorRow(e));
                    }
                    rows.insert(rows.end(), all_failures.begin(), all_failures.end());
                    RMRS::DiscontinuityIO::writeTable(prefix + "_errors.csv",
                        RMRS::DiscontinuityIO::errorHeader(), rows);
                }

                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Stations scored:   %d of %d\n",
                            static_cast<int>(summary.scored_station_count),
                            static_cast<int>(summary.station_count));
                PetscPrintf(comm, "Families scored:   %d of %d\n",
                            static_cast<int>(all_families.size()),
                            static_cast<int>(summary.family_count));
                PetscPrintf(comm, "Record errors:     %d\n",
                            static_cast<int>(analysis.recordErrors().size()));
                PetscPrintf(comm, "Unit failures:     %d\n", static_cast<int>(all_failures.size()));
                if (summary.dominant_class) {
                    PetscPrintf(comm, "Mean station RMR:  %.1f\n", summary.mean_rmr);
                    PetscPrintf(comm, "Dominant class:    %s\n",
                                summary.dominant_class->label().c_str());
                }
                PetscPrintf(comm, "Wall time:         %.3f seconds\n", end_time - start_time);
                PetscPrintf(comm, "Output files written to: %s_*.csv\n", prefix.c_str());
                PetscPrintf(comm, "============================================================\n");
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return 0;
}
