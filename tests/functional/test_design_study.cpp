/**
 * @file test_design_study.cpp
 * @brief Functional tests for configuration-driven design studies
 */

#include <gtest/gtest.h>
#include "DesignStudy.hpp"
#include "PsychroError.hpp"
#include <fstream>
#include <cstdio>

using namespace MASE;

class DesignStudyTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove("test_study.config");
            for (const char* suffix : {"_states.csv", "_processes.csv", "_system.txt",
                                       "_chart_lines.dat", "_chart_states.dat",
                                       "_chart_processes.dat", "_chart.gp"}) {
                std::remove((std::string("test_study") + suffix).c_str());
            }
        }
    }

    static ConfigReader load(const std::string& content) {
        ConfigReader reader;
        reader.loadString(content);
        return reader;
    }

    // Data-hall study: Abu Dhabi design days, CRAH states, AHU setpoints
    static std::string dataHallConfig() {
        return
            "[LOCATION]\n"
            "key = ABU DHABI\n"
            "[ATMOSPHERE]\n"
            "pressure = 101325 Pa\n"
            "[STATE:CRAH Off-Coil]\n"
            "dry_bulb = 25.0\n"
            "wet_bulb = 16.5\n"
            "[STATE:CRAH On-Coil]\n"
            "dry_bulb = 36.0\n"
            "wet_bulb = 19.8\n"
            "[STATE:Winter]\n"
            "dry_bulb = 7.3\n"
            "wet_bulb = 3.6\n"
            "[SETPOINTS]\n"
            "crah_off_coil = CRAH Off-Coil\n"
            "crah_on_coil = CRAH On-Coil\n"
            "winter_state = Winter\n"
            "[SYSTEM]\n"
            "it_load = 1500 kW\n"
            "[PROCESS:Summer Dehumidification]\n"
            "from = OAT Max 0.4%H\n"
            "to = OC Dehum\n"
            "flow = AHU\n"
            "[PROCESS:CRAH Cooling Loop]\n"
            "from = CRAH On-Coil\n"
            "to = CRAH Off-Coil\n"
            "flow = CRAH\n"
            "[PROCESS:Winter Heating]\n"
            "from = Winter\n"
            "to = OC Heat\n"
            "flow = AHU\n"
            "[CHART]\n"
            "t_min = -10\n"
            "t_max = 50\n"
            "steps = 60\n"
            "[OUTPUT]\n"
            "prefix = test_study\n";
    }

    int rank;
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(DesignStudyTest, CreateStudy) {
    DesignStudy study(PETSC_COMM_WORLD);
    EXPECT_TRUE(study.states().empty());
    EXPECT_FALSE(study.systemFlows().has_value());
}

TEST_F(DesignStudyTest, StepsNeedInitialization) {
    DesignStudy study(PETSC_COMM_WORLD);
    EXPECT_NE(study.resolveStates(), 0);
    EXPECT_NE(study.evaluateProcesses(), 0);
}

TEST_F(DesignStudyTest, InitializeFromFile) {
    if (rank == 0) {
        std::ofstream config("test_study.config");
        config << dataHallConfig();
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    DesignStudy study(PETSC_COMM_WORLD);
    EXPECT_EQ(study.initializeFromConfigFile("test_study.config"), 0);
    EXPECT_EQ(study.outputPrefix(), "test_study");

    DesignStudy missing(PETSC_COMM_WORLD);
    EXPECT_NE(missing.initializeFromConfigFile("no_such_study.config"), 0);
}

TEST_F(DesignStudyTest, InvalidConfigurationIsRejected) {
    if (rank == 0) {
        std::ofstream config("test_study.config");
        config << "[LOCATION]\nkey = ATLANTIS\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    DesignStudy study(PETSC_COMM_WORLD);
    EXPECT_NE(study.initializeFromConfigFile("test_study.config"), 0);
}

TEST_F(DesignStudyTest, BadOutputUnitIsRejected) {
    DesignStudy study(PETSC_COMM_WORLD);
    EXPECT_NE(study.initialize(load("[OUTPUT]\ntemperature_unit = Pa\n")), 0);
}

TEST_F(DesignStudyTest, CommandLineOverrides) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    EXPECT_NE(study.setLocation("ATLANTIS"), 0);
    EXPECT_EQ(study.setLocation("singapore"), 0);
    EXPECT_EQ(study.setOutputPrefix("test_study_b"), 0);
    EXPECT_EQ(study.outputPrefix(), "test_study_b");
}

// ============================================================================
// Pressure Resolution Tests
// ============================================================================

TEST_F(DesignStudyTest, PressureFromLocationAltitude) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load("[LOCATION]\nkey = JOHANNESBURG\n")), 0);
    ASSERT_EQ(study.resolveStates(), 0);
    EXPECT_NEAR(study.pressure(), 82562.0, 5.0);
    EXPECT_DOUBLE_EQ(study.states().get("OAT Max N=20").pressure(), study.pressure());
}

TEST_F(DesignStudyTest, AltitudeOverrideBeatsConfigAltitude) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load("[ATMOSPHERE]\naltitude = 0\n"
                                    "[STATE:Room]\ndry_bulb = 24\nrelative_humidity = 0.5\n")), 0);
    ASSERT_EQ(study.setAltitude(1000.0), 0);
    ASSERT_EQ(study.resolveStates(), 0);
    EXPECT_NEAR(study.pressure(), 89874.5, 1.0);
}

TEST_F(DesignStudyTest, ExplicitPressureWins) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    ASSERT_EQ(study.setAltitude(1000.0), 0);
    ASSERT_EQ(study.resolveStates(), 0);
    EXPECT_DOUBLE_EQ(study.pressure(), 101325.0);
}

// ============================================================================
// Full Study Tests
// ============================================================================

TEST_F(DesignStudyTest, DataHallStates) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    ASSERT_EQ(study.run(), 0);

    const StateTable& states = study.states();
    std::vector<std::string> labels = states.labels();
    ASSERT_EQ(labels.size(), 5u + 3u + 4u);
    EXPECT_EQ(labels[0], "OAT Max N=20");
    EXPECT_EQ(labels[5], "CRAH Off-Coil");
    EXPECT_EQ(labels[8], "OC Max Cool");
    EXPECT_EQ(labels[11], "OC Heat");

    EXPECT_NEAR(states.get("CRAH Off-Coil").dewPoint(), 11.0951, 2e-3);
    EXPECT_NEAR(states.get("OC Dehum").dryBulb(), 15.0951, 2e-3);
    EXPECT_NEAR(states.get("OC Enthalpy").dryBulb(), 15.7016, 2e-3);
    EXPECT_NEAR(states.get("OC Heat").wetBulb(), 16.2107, 2e-3);
}

TEST_F(DesignStudyTest, DataHallProcessesUseSystemFlows) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    ASSERT_EQ(study.run(), 0);

    ASSERT_TRUE(study.systemFlows().has_value());
    const SystemFlows& flows = *study.systemFlows();
    EXPECT_NEAR(flows.sensible_load, 1582500.0, 1e-6);

    const ProcessLog& log = study.processes();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.entries()[0].result.name, "Summer Dehumidification");
    EXPECT_DOUBLE_EQ(log.entries()[0].result.mass_flow, flows.ahu_mass_flow);
    EXPECT_LT(log.entries()[0].result.total_heat, 0.0);

    // The CRAH loop removes exactly the sensible load it was sized for
    const ProcessResult& loop = log.entries()[1].result;
    EXPECT_DOUBLE_EQ(loop.mass_flow, flows.crah_mass_flow);
    EXPECT_NEAR(-loop.sensible_heat, flows.sensible_load, 1e-3);

    // Winter heating at constant moisture is purely sensible
    const ProcessResult& heating = log.entries()[2].result;
    EXPECT_GT(heating.sensible_heat, 0.0);
    EXPECT_NEAR(*heating.sensible_heat_ratio, 1.0, 1e-9);
}

TEST_F(DesignStudyTest, ChartIsGatheredInOrder) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    ASSERT_EQ(study.run(), 0);

    if (rank == 0) {
        const auto& series = study.chartSeries();
        ASSERT_EQ(series.size(), 1u + 9u + 11u + 7u);
        EXPECT_EQ(series[0].kind, IsoLineKind::SATURATION);
        EXPECT_EQ(series[0].points.size(), 61u);
        EXPECT_EQ(series[1].label, "RH 10%");
        EXPECT_EQ(series.back().kind, IsoLineKind::WET_BULB);
    } else {
        EXPECT_TRUE(study.chartSeries().empty());
    }
}

TEST_F(DesignStudyTest, DerivedLeavingStates) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(
        "[STATE:Room]\n"
        "dry_bulb = 24\n"
        "relative_humidity = 50 %\n"
        "[OFFCOIL:Coil]\n"
        "dew_point = 10\n"
        "relative_humidity = 0.9\n"
        "[PROCESS:Room Load]\n"
        "from = Room\n"
        "to = Supply\n"
        "to_dry_bulb = 14\n"
        "sensible_heat_ratio = 0.8\n"
        "mass_flow = 1.0\n"
        "[PROCESS:Reheat]\n"
        "from = Coil\n"
        "to = Warm\n"
        "to_dry_bulb = 20\n"
        "volume_flow = 1.0\n"
        "[CHART]\n"
        "enabled = false\n")), 0);
    ASSERT_EQ(study.run(), 0);

    const StateTable& states = study.states();
    EXPECT_NEAR(states.get("Coil").dryBulb(), 11.5825, 2e-3);
    EXPECT_NEAR(states.get("Supply").humidityRatio(), 0.0082862, 2e-6);
    EXPECT_NEAR(states.get("Warm").humidityRatio(), states.get("Coil").humidityRatio(), 1e-15);

    const ProcessLog& log = study.processes();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_NEAR(*log.entries()[0].result.sensible_heat_ratio, 0.8, 1e-5);
    EXPECT_NEAR(log.entries()[1].result.mass_flow,
                1.0 / states.get("Coil").specificVolume(), 1e-12);
    EXPECT_TRUE(study.chartSeries().empty());
}

TEST_F(DesignStudyTest, MixFeedsProcess) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(
        "[STATE:Room]\n"
        "dry_bulb = 24\n"
        "relative_humidity = 0.5\n"
        "[STATE:Outdoor]\n"
        "dry_bulb = 35\n"
        "wet_bulb = 25\n"
        "[MIX:Mixed]\n"
        "stream_a = Room\n"
        "mass_flow_a = 1\n"
        "stream_b = Outdoor\n"
        "mass_flow_b = 1\n"
        "[PROCESS:Cool Mixed]\n"
        "from = Mixed\n"
        "to = Room\n"
        "mass_flow = 2\n"
        "[CHART]\n"
        "enabled = false\n")), 0);
    ASSERT_EQ(study.run(), 0);

    EXPECT_NEAR(study.states().get("Mixed").dryBulb(), 29.5325, 2e-3);
    ASSERT_EQ(study.processes().size(), 1u);
    EXPECT_EQ(study.processes().entries()[0].from_label, "Mixed");
}

// ============================================================================
// Failure Tests
// ============================================================================

TEST_F(DesignStudyTest, UnknownStateFails) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(
        "[STATE:Room]\ndry_bulb = 24\nrelative_humidity = 0.5\n"
        "[PROCESS:Broken]\nfrom = Room\nto = Nowhere\nmass_flow = 1\n")), 0);
    ASSERT_EQ(study.resolveStates(), 0);
    EXPECT_NE(study.evaluateProcesses(), 0);
}

TEST_F(DesignStudyTest, SystemFlowWithoutSystemFails) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(
        "[STATE:A]\ndry_bulb = 30\nrelative_humidity = 0.4\n"
        "[STATE:B]\ndry_bulb = 20\nrelative_humidity = 0.6\n"
        "[PROCESS:Loop]\nfrom = A\nto = B\nflow = CRAH\n")), 0);
    ASSERT_EQ(study.resolveStates(), 0);
    ASSERT_EQ(study.computeSystemFlows(), 0);
    EXPECT_FALSE(study.systemFlows().has_value());
    EXPECT_NE(study.evaluateProcesses(), 0);
}

TEST_F(DesignStudyTest, InvalidStateFails) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load("[STATE:Bad]\ndry_bulb = 20\nwet_bulb = 25\n")), 0);
    EXPECT_NE(study.resolveStates(), 0);
}

TEST_F(DesignStudyTest, MalformedValueFailsInitialization) {
    DesignStudy mix(PETSC_COMM_WORLD);
    EXPECT_NE(mix.initialize(load(
        "[STATE:A]\ndry_bulb = 30\nrelative_humidity = 0.4\n"
        "[MIX:M]\nstream_a = A\nmass_flow_a = 2 kgs\nstream_b = A\nmass_flow_b = 1\n")), 0);

    if (rank == 0) {
        std::ofstream config("test_study.config");
        config << "[STATE:A]\ndry_bulb = 30\nrelative_humidity = 0.4\n"
                  "[SYSTEM]\nit_load = 1.2 MWx\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    DesignStudy system(PETSC_COMM_WORLD);
    EXPECT_NE(system.initializeFromConfigFile("test_study.config"), 0);
}

// ============================================================================
// Output Tests
// ============================================================================

TEST_F(DesignStudyTest, WritesOutputFiles) {
    DesignStudy study(PETSC_COMM_WORLD);
    ASSERT_EQ(study.initialize(load(dataHallConfig())), 0);
    ASSERT_EQ(study.run(), 0);
    ASSERT_EQ(study.writeOutput(), 0);
    ASSERT_EQ(study.printSummary(), 0);

    if (rank == 0) {
        for (const char* suffix : {"_states.csv", "_processes.csv", "_system.txt",
                                   "_chart_lines.dat", "_chart.gp"}) {
            std::ifstream file(std::string("test_study") + suffix);
            EXPECT_TRUE(file.good()) << suffix;
        }

        std::ifstream states("test_study_states.csv");
        std::string header;
        std::getline(states, header);
        EXPECT_EQ(header.rfind("label,Tdb [degC]", 0), 0u);
    }
}
