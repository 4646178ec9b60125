/*
 * Example: Single Station Rating
 *
 * Rates one scanline station built in code and prints the partial
 * ratings, then clusters its orientations into families. No input
 * files are needed.
 */

#include "RMRS.hpp"
#include "CodeDictionary.hpp"
#include "Discontinuity.hpp"
#include "FamilyStatistics.hpp"
#include "OrientationClustering.hpp"
#include "RatingAggregator.hpp"
#include <petsc.h>
#include <iostream>
#include <iomanip>

static char help[] = "Example: RMR of a single scanline station\n"
                    "  -ucs_class <code>   Strength class (default R4)\n"
                    "  -rqd <percent>      Measured RQD (default: from frequency)\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    MPI_Comm comm = PETSC_COMM_WORLD;
    int rank;
    MPI_Comm_rank(comm, &rank);

    char ucs_class[64] = "R4";
    PetscReal rqd = 0.0;
    PetscBool rqd_given = PETSC_FALSE;
    ierr = PetscOptionsGetString(nullptr, nullptr, "-ucs_class", ucs_class,
                                 sizeof(ucs_class), nullptr); CHKERRQ(ierr);
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-rqd", &rqd, &rqd_given); CHKERRQ(ierr);

    if (rank == 0) {
        try {
            RMRS::CodeDictionary dictionary = RMRS::CodeDictionary::createDefault();
            RMRS::DiscontinuityValidator validator(dictionary);

            // Two joint sets and a bedding plane along a 9 m scanline
            const double orientations[][2] = {
                {44, 64}, {46, 66}, {45, 65}, {47, 63}, {43, 67},
                {210, 30}, {208, 32}, {212, 29}, {209, 31},
                {130, 85}
            };

            RMRS::Station station;
            station.id = "ST-EX";
            station.ucs_class = ucs_class;
            if (rqd_given) station.rqd = static_cast<double>(rqd);

            int row = 1;
            for (const auto& o : orientations) {
                RMRS::DiscontinuityRecord r;
                r.source_row = row;
                r.station = station.id;
                r.distance = std::to_string(0.9 * row);
                r.type = row <= 5 ? "J" : (row <= 9 ? "B" : "F");
                r.dip_direction = std::to_string(o[0]);
                r.dip = std::to_string(o[1]);
                r.spacing = "4";
                r.persistence = "2";
                r.aperture = "3";
                r.roughness = row % 3 == 0 ? "3" : "2";
                r.infill = "1";
                r.weathering = "2";
                r.groundwater = row <= 7 ? "2" : "3";
                station.discontinuities.push_back(validator.validate(r));
                row++;
            }

            RMRS::RatingAggregator aggregator(dictionary);
            RMRS::RmrScore score = aggregator.scoreStation(station, RMRS::DEFAULT_ORIENTATION_ADJUSTMENT);

            std::cout << std::fixed << std::setprecision(1);
            std::cout << "================================================\n";
            std::cout << "  Station " << score.unit << " (" << score.discontinuity_count
                      << " discontinuities)\n";
            std::cout << "================================================\n";
            std::cout << "  Strength (" << score.ucs_class << "):      " << score.strength_rating << "\n";
            std::cout << "  RQD " << score.rqd << " %"
                      << (score.rqd_derived ? " (estimated)" : " (measured)") << ": "
                      << score.rqd_rating << "\n";
            std::cout << "  Spacing " << score.mean_spacing_mm << " mm:  " << score.spacing_rating << "\n";
            std::cout << "  Condition:          " << score.condition_rating << "\n";
            std::cout << "  Groundwater (" << score.dominant_groundwater_code << "):    "
                      << score.groundwater_rating << "\n";
            std::cout << "  Orientation:        " << score.orientation_adjustment << "\n";
            std::cout << "  RMR:                " << score.total << "  "
                      << score.classification.label() << "\n\n";

            std::vector<RMRS::Orientation> poles;
            for (const auto& d : station.discontinuities) {
                poles.push_back(d.orientation);
            }
            RMRS::ClusteringResult clustering = RMRS::OrientationClustering().cluster(poles);
            std::vector<RMRS::Family> families =
                RMRS::FamilyStatistics::buildFamilies(clustering, station.discontinuities, {station});

            RMRS::FamilyStatistics statistics(aggregator, RMRS::DEFAULT_ORIENTATION_ADJUSTMENT);
            for (const auto& family : families) {
                RMRS::RmrScore fs = statistics.score(family);
                std::cout << "  " << family.label() << "  " << family.mean.dip_direction << "/"
                          << family.mean.dip << "  n=" << family.size()
                          << "  " << RMRS::toString(family.dominant_type)
                          << "  RMR " << fs.total << "  " << fs.classification.label() << "\n";
            }
            std::cout << "  Unclustered: " << clustering.unclustered.size() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return ierr;
}
