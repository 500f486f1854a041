/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file main.cpp
 *
 * @brief Command-line driver: I-V curve parameters for one parameter set.
 */

#include "main.hpp"

#include <getopt.h>

#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "FloatArray.hpp"
#include "ModelParameters.hpp"
#include "SingleDiodeEquation.hpp"
#include "SolverOptions.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options]\n";
    std::cout << "Model parameters:\n";
    std::cout << "  --ns <int>                Cells in series (default 1)\n";
    std::cout << "  --t-degc <double>         Junction temperature in degC "
                 "(default 25)\n";
    std::cout << "  --iph <double>            Photocurrent in A (default 6.0)\n";
    std::cout << "  --irs <double>            Saturation current in A "
                 "(default 1e-9)\n";
    std::cout << "  --n <double>              Ideality factor (default 1.0)\n";
    std::cout << "  --rs <double>             Series resistance in Ohm "
                 "(default 0.05)\n";
    std::cout << "  --gp <double>             Shunt conductance in S "
                 "(default 0.001)\n";
    std::cout << "Solver options:\n";
    std::cout << "  --tol-abs <double>        Absolute step tolerance "
                 "(default 1.48e-8)\n";
    std::cout << "  --tol-rel <double>        Relative step tolerance "
                 "(default 0)\n";
    std::cout << "  --max-iters <int>         Max iterations per element "
                 "(default 50)\n";
    std::cout << "  --diag-file <file>        Append solver diagnostics to "
                 "file\n";
    std::cout << "  --diag-verbose            Verbose diagnostics\n";
    std::cout << "Output:\n";
    std::cout << "  --sweep <int>             Also print an I-V table with "
                 "<int> points on [0, Voc]\n";
    std::cout << "  --help                    Show this help message\n";
}

static void printCurveParameters(const IVCurveParameters &curve)
{
    std::cout << std::setprecision(10);
    std::cout << "I_sc_A\t\t" << curve.I_sc_A.item() << "\n";
    std::cout << "R_sc_Ohm\t" << curve.R_sc_Ohm.item() << "\n";
    std::cout << "V_x_V\t\t" << curve.V_x_V.item() << "\n";
    std::cout << "I_x_A\t\t" << curve.I_x_A.item() << "\n";
    std::cout << "I_mp_A\t\t" << curve.I_mp_A.item() << "\n";
    std::cout << "P_mp_W\t\t" << curve.P_mp_W.item() << "\n";
    std::cout << "V_mp_V\t\t" << curve.V_mp_V.item() << "\n";
    std::cout << "V_xx_V\t\t" << curve.V_xx_V.item() << "\n";
    std::cout << "I_xx_A\t\t" << curve.I_xx_A.item() << "\n";
    std::cout << "R_oc_Ohm\t" << curve.R_oc_Ohm.item() << "\n";
    std::cout << "V_oc_V\t\t" << curve.V_oc_V.item() << "\n";
    std::cout << "FF\t\t" << curve.FF.item() << std::endl;
}

static void printSweep(const ModelParameters &params, double V_oc_V, int points,
                       const SolverOptions &options)
{
    std::vector<double> voltages(static_cast<size_t>(points));
    for (int k = 0; k < points; ++k)
        voltages[static_cast<size_t>(k)] =
            points == 1 ? 0.0 : V_oc_V * k / (points - 1);

    // One batched solve for the whole table.
    const FloatArray V_V(voltages);
    const PowerAtVoltage pv = powerAtVoltage(V_V, params, options);

    std::cout << "\nV_V\t\tI_A\t\tP_W\n";
    std::cout << std::setprecision(8);
    for (Eigen::Index k = 0; k < V_V.size(); ++k)
        std::cout << V_V[k] << "\t" << pv.I_A[k] << "\t" << pv.P_W[k] << "\n";
    std::cout.flush();
}

int main(int argc, char *argv[])
{
    SolverOptions options;
    double N_s = 1.0, T_degC = 25.0, I_ph_A = 6.0, I_rs_A = 1e-9, n = 1.0,
           R_s_Ohm = 0.05, G_p_S = 0.001;
    int sweepPoints = 0;

    static struct option long_options[] = {
        {"ns", required_argument, 0, 0},
        {"t-degc", required_argument, 0, 0},
        {"iph", required_argument, 0, 0},
        {"irs", required_argument, 0, 0},
        {"n", required_argument, 0, 0},
        {"rs", required_argument, 0, 0},
        {"gp", required_argument, 0, 0},
        {"tol-abs", required_argument, 0, 0},
        {"tol-rel", required_argument, 0, 0},
        {"max-iters", required_argument, 0, 0},
        {"diag-file", required_argument, 0, 0},
        {"diag-verbose", no_argument, 0, 0},
        {"sweep", required_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    try {
        // Use getopt_long to iterate over options
        while ((c = getopt_long(argc, argv, "h", long_options,
                                &option_index)) != -1) {
            if (c == 'h') {
                printHelp(argv[0]);
                return 0;
            } else if (c == 0) {
                std::string name = long_options[option_index].name;
                if (name == "ns")
                    N_s = std::stoi(optarg);
                else if (name == "t-degc")
                    T_degC = std::stod(optarg);
                else if (name == "iph")
                    I_ph_A = std::stod(optarg);
                else if (name == "irs")
                    I_rs_A = std::stod(optarg);
                else if (name == "n")
                    n = std::stod(optarg);
                else if (name == "rs")
                    R_s_Ohm = std::stod(optarg);
                else if (name == "gp")
                    G_p_S = std::stod(optarg);
                else if (name == "tol-abs")
                    options.tolAbs = std::stod(optarg);
                else if (name == "tol-rel")
                    options.tolRel = std::stod(optarg);
                else if (name == "max-iters")
                    options.maxIters = std::stoi(optarg);
                else if (name == "diag-file")
                    options.diagFile = std::string(optarg);
                else if (name == "diag-verbose")
                    options.diagVerbose = true;
                else if (name == "sweep")
                    sweepPoints = std::stoi(optarg);
            } else {
                printHelp(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "Error: Invalid numeric argument: " << ex.what()
                  << std::endl;
        return 1;
    }

    ModelParameters params(N_s, T_degC, I_ph_A, I_rs_A, n, R_s_Ohm, G_p_S);

    // Validate options and parameters (throws on bad input)
    try {
        options.validate();
        params.validate();
        if (sweepPoints < 0)
            throw std::invalid_argument("sweep must be >= 0");
    } catch (const std::exception &ex) {
        std::cerr << "Error: Invalid input: " << ex.what() << std::endl;
        return 1;
    }

    try {
        IVCurveParameters curve = ivCurveParameters(params, options);
        printCurveParameters(curve);
        if (sweepPoints > 0)
            printSweep(params, curve.V_oc_V.item(), sweepPoints, options);
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
