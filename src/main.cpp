#include "MASE.hpp"
#include "DesignStudy.hpp"
#include "ConfigReader.hpp"
#include "DesignConditions.hpp"
#include "UnitSystem.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "MASE - Moist Air State Engine\n"
                    "Usage: mase [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -location <key>          Design-day location (overrides [LOCATION])\n"
                    "  -altitude <m>            Site altitude in m (overrides [ATMOSPHERE] altitude)\n"
                    "  -o <prefix>              Output file prefix\n"
                    "  -generate_config <file>  Write a template configuration\n"
                    "  -list_locations          List the design-day catalog\n"
                    "  -list_units              List the unit database\n\n"
                    "Examples:\n"
                    "  # Run a design study\n"
                    "  mpirun -np 4 mase -c config/data_hall.config\n\n"
                    "  # Same study at another site\n"
                    "  mase -c config/data_hall.config -location DUBAI -o output/dubai\n\n"
                    "  # Generate template configuration\n"
                    "  mase -generate_config my_study.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    MASE::ConfigReader::generateTemplate(generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(comm, "Error: %s\n", e.what());
                    ierr = PetscFinalize();
                    return 1;
                }
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit this file to customize your study.\n");
            }
            ierr = PetscFinalize();
            return 0;
        }

        PetscBool list_locations = PETSC_FALSE;
        PetscBool list_units = PETSC_FALSE;
        ierr = PetscOptionsHasName(nullptr, nullptr, "-list_locations", &list_locations); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-list_units", &list_units); CHKERRQ(ierr);

        if (list_locations || list_units) {
            if (rank == 0 && list_locations) {
                const MASE::DesignConditionsCatalog& catalog =
                    MASE::DesignConditionsCatalog::standard();
                PetscPrintf(comm, "%-20s %-22s %8s %10s %10s\n",
                            "Key", "Country", "Alt [m]", "Cool DB", "Heat DB");
                for (const auto& key : catalog.locations()) {
                    const MASE::DesignDayRecord& r = catalog.get(key);
                    PetscPrintf(comm, "%-20s %-22s %8.0f %10.1f %10.1f\n",
                                key.c_str(), r.country.c_str(), r.altitude,
                                r.cooling_db_n20, r.heating_db_n20);
                }
            }
            if (rank == 0 && list_units) {
                MASE::UnitSystem units;
                units.printDatabase(std::cout);
            }
            ierr = PetscFinalize();
            return 0;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char location[256] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        PetscReal altitude = 0.0;
        PetscBool config_provided = PETSC_FALSE;
        PetscBool location_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool altitude_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-location", location,
                                     sizeof(location), &location_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-altitude", &altitude,
                                   &altitude_provided); CHKERRQ(ierr);

        if (!config_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: mase -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  MASE - Moist Air State Engine\n");
            PetscPrintf(comm, "  Version %s\n", MASE_VERSION_STRING);
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "Config file:   %s\n", config_file);
            if (location_provided) {
                PetscPrintf(comm, "Location:      %s\n", location);
            }
            if (altitude_provided) {
                PetscPrintf(comm, "Altitude:      %g m\n", static_cast<double>(altitude));
            }
            PetscPrintf(comm, "\n");
        }

        try {
            MASE::DesignStudy study(comm);

            ierr = study.initializeFromConfigFile(config_file); CHKERRQ(ierr);
            if (location_provided) {
                ierr = study.setLocation(location); CHKERRQ(ierr);
            }
            if (altitude_provided) {
                ierr = study.setAltitude(static_cast<double>(altitude)); CHKERRQ(ierr);
            }
            if (output_provided) {
                ierr = study.setOutputPrefix(output_prefix); CHKERRQ(ierr);
            }

            if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Running design study...\n");
                PetscPrintf(comm, "------------------------------------------------------------\n");
            }

            double start_time = MPI_Wtime();
            ierr = study.run(); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            ierr = study.printSummary(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Study completed in %.3f seconds\n", end_time - start_time);
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Writing output...\n");
            }

            ierr = study.writeOutput(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "\n");
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
