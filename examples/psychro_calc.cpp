/**
 * @file psychro_calc.cpp
 * @brief Command-line moist-air state calculator
 *
 * Resolves one state from dry-bulb plus one secondary descriptor and
 * prints every property. Values may carry units; bare numbers are taken
 * in engine units (degC, fraction, kg/kg, J/kg, m, Pa).
 *
 * Usage:
 *   ./psychro_calc <dry_bulb> <pair> <value> [--altitude <m>] [--pressure <value>]
 *   ./psychro_calc --help
 *
 * Examples:
 *   ./psychro_calc 24 rh 0.5
 *   ./psychro_calc "95 degF" twb "75 degF" --altitude 1694
 *   ./psychro_calc 18 w "9 g/kg" --pressure "14.2 psi"
 */

#include "AirState.hpp"
#include "AtmosphericModel.hpp"
#include "PsychroError.hpp"
#include "StateTable.hpp"
#include "UnitSystem.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace MASE;

void printHelp() {
    std::cout << "\n";
    std::cout << "MASE Psychrometric Calculator\n";
    std::cout << "=============================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  psychro_calc <dry_bulb> <pair> <value> [--altitude <m>] [--pressure <value>]\n";
    std::cout << "  psychro_calc --help\n\n";
    std::cout << "Pairs:\n";
    std::cout << "  rh    relative humidity (fraction, or with %)\n";
    std::cout << "  twb   wet-bulb temperature\n";
    std::cout << "  tdp   dew-point temperature\n";
    std::cout << "  w     humidity ratio (kg/kg, or with g/kg, gr/lb)\n";
    std::cout << "  h     specific enthalpy (J/kg, or with kJ/kg, BTU/lb)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  psychro_calc 24 rh 0.5\n";
    std::cout << "  psychro_calc \"95 degF\" twb \"75 degF\" --altitude 1694\n";
    std::cout << "  psychro_calc 18 w \"9 g/kg\" --pressure \"14.2 psi\"\n\n";
}

void printState(const AirState& state, const AtmosphericContext& context) {
    ReportUnits report;
    auto line = [&](const char* name, double si, const std::string& quantity) {
        std::cout << "  " << std::setw(26) << std::left << name
                  << std::setw(14) << std::right << report.convert(si, quantity)
                  << " " << report.unitFor(quantity) << "\n";
    };

    std::cout << "\n";
    std::cout << "Moist Air State\n";
    std::cout << "===============\n\n";
    std::cout << "  " << context.describe() << "\n\n";
    std::cout << std::fixed << std::setprecision(4);
    line("Dry-bulb temperature", state.dryBulb(), "temperature");
    line("Wet-bulb temperature", state.wetBulb(), "temperature");
    line("Dew-point temperature", state.dewPoint(), "temperature");
    line("Relative humidity", state.relativeHumidity(), "relative_humidity");
    line("Humidity ratio", state.humidityRatio(), "humidity_ratio");
    line("Specific enthalpy", state.enthalpy(), "enthalpy");
    line("Specific volume", state.specificVolume(), "specific_volume");
    line("Density", state.density(), "density");
    line("Specific heat", state.specificHeat(), "specific_heat");
    line("Barometric pressure", state.pressure(), "pressure");
    line("Vapor pressure", state.vaporPressure(), "pressure");
    line("Saturation vapor pressure", state.saturationVaporPressure(), "pressure");
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    UnitSystem& units = UnitSystemManager::getInstance();

    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (argc != 4 && argc != 6) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    try {
        const double t_dry_bulb = units.parseAndConvertToBase(argv[1]);
        const InputPair pair = parseInputPair(argv[2]);
        const double value = units.parseAndConvertToBase(argv[3]);

        AtmosphericContext context;
        if (argc == 6) {
            if (strcmp(argv[4], "--altitude") == 0) {
                context = AtmosphericContext::fromAltitude(units.parseAndConvertToBase(argv[5]));
            } else if (strcmp(argv[4], "--pressure") == 0) {
                context = AtmosphericContext::fromPressure(units.parseAndConvertToBase(argv[5]));
            } else {
                std::cerr << "Error: Unknown option '" << argv[4] << "'\n";
                return 1;
            }
        }

        StateInput input;
        input.pair = pair;
        input.dry_bulb = t_dry_bulb;
        input.value = value;

        AirState state = AirState::create(input, context);
        printState(state, context);

    } catch (const PsychroError& e) {
        std::cerr << "Error (" << toString(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
