#include "FSPLIT.hpp"
#include "FaultPartitioner.hpp"
#include "ConfigReader.hpp"
#include "CoordinateSystem.hpp"
#include <petsc.h>
#include <gdal_priv.h>
#include <iostream>
#include <string>

static char help[] = "fsplit - split a fault dataset into one file per intersected region\n"
                    "Usage: fsplit [options]\n\n"
                    "Options:\n"
                    "  -c <file>              Configuration file (.config)\n"
                    "  -faults <file>         Fault dataset (any OGR vector format)\n"
                    "  -regions <file>        Region polygon dataset\n"
                    "  -o <dir>               Output folder\n"
                    "  -name_field <name>     Region attribute used as the region name\n"
                    "  -default_crs <id>      CRS assumed for datasets without one\n"
                    "  -generate_config <f>   Write a template configuration and exit\n\n"
                    "Examples:\n"
                    "  # Use configuration file (recommended)\n"
                    "  mpirun -np 4 fsplit -c config/faults_by_country.config\n\n"
                    "  # Everything on the command line\n"
                    "  fsplit -faults gem_active_faults.geojson -regions ne_10m_admin_0_countries.shp \\\n"
                    "         -o output/faults_by_country\n\n"
                    "  # Generate template configuration\n"
                    "  fsplit -generate_config my_config.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);
    GDALAllRegister();

    int exit_code = 0;
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
                if (FSPLIT::ConfigReader::generateTemplate(generate_config)) {
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                    PetscPrintf(comm, "Edit this file to point at your datasets.\n");
                } else {
                    exit_code = 1;
                }
            }
            MPI_Bcast(&exit_code, 1, MPI_INT, 0, comm);
            ierr = PetscFinalize();
            return exit_code;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char faults_file[PETSC_MAX_PATH_LEN] = "";
        char regions_file[PETSC_MAX_PATH_LEN] = "";
        char output_dir[PETSC_MAX_PATH_LEN] = "";
        char name_field[256] = "";
        char default_crs[256] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool faults_provided = PETSC_FALSE;
        PetscBool regions_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool name_provided = PETSC_FALSE;
        PetscBool crs_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-faults", faults_file,
                                     sizeof(faults_file), &faults_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-regions", regions_file,
                                     sizeof(regions_file), &regions_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_dir,
                                     sizeof(output_dir), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-name_field", name_field,
                                     sizeof(name_field), &name_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-default_crs", default_crs,
                                     sizeof(default_crs), &crs_provided); CHKERRQ(ierr);

        if (!config_provided && !(faults_provided && regions_provided && output_provided)) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) or -faults, -regions and -o required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: fsplit -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  FSPLIT - Fault Splitter\n");
            PetscPrintf(comm, "  Version %s\n", FSPLIT_VERSION);
            PetscPrintf(comm, "  PROJ version %s, GDAL version %s\n",
                        FSPLIT::CoordinateTransformer::getProjVersion().c_str(),
                        GDALVersionInfo("RELEASE_NAME"));
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
        }

        try {
            FSPLIT::FaultPartitioner partitioner(comm);

            FSPLIT::PartitionConfig config;
            if (config_provided) {
                FSPLIT::ConfigReader reader;
                if (!reader.loadFile(config_file)) {
                    SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
                }
                reader.parsePartitionConfig(config);
            }

            // Command-line options override the configuration file
            if (faults_provided) config.faults_path = faults_file;
            if (regions_provided) config.regions_path = regions_file;
            if (output_provided) config.output_dir = output_dir;
            if (name_provided) config.region_name_field = name_field;
            if (crs_provided) config.default_crs = default_crs;

            ierr = partitioner.initialize(config); CHKERRQ(ierr);

            double start_time = MPI_Wtime();
            ierr = partitioner.run(); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            if (rank == 0) {
                PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
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
    return exit_code;
}
