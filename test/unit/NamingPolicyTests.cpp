//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "pklgen/CodeGen/NamingPolicy.h"

bool runNamingPolicyTests()
{
    using pklgen::pythonModuleStem;
    using pklgen::pythonOutputFileName;
    using pklgen::pythonQuote;
    using pklgen::pythonSanitizeIdentifier;
    using pklgen::pythonToSnakeCaseIdentifier;
    using pklgen::pythonToUpperSnakeCaseIdentifier;

    if (pythonSanitizeIdentifier("def") != "def_" || pythonSanitizeIdentifier("None") != "None_")
    {
        std::cerr << "Python keyword sanitization mismatch\n";
        return false;
    }
    if (pythonSanitizeIdentifier("max-size") != "max_size" || pythonSanitizeIdentifier("3d") != "_3d" ||
        pythonSanitizeIdentifier("") != "_")
    {
        std::cerr << "identifier character sanitization mismatch\n";
        return false;
    }
    if (pythonSanitizeIdentifier("name") != "name")
    {
        std::cerr << "plain identifier should be unchanged\n";
        return false;
    }

    if (pythonToSnakeCaseIdentifier("FlightControlMode") != "flight_control_mode")
    {
        std::cerr << "snake_case projection mismatch\n";
        return false;
    }
    if (pythonToSnakeCaseIdentifier("9AxisIMU") != "_9_axis_imu")
    {
        std::cerr << "snake_case digit-prefix projection mismatch\n";
        return false;
    }
    if (pythonToUpperSnakeCaseIdentifier("bird-watching") != "BIRD_WATCHING" ||
        pythonToUpperSnakeCaseIdentifier("OpticalFlowRate") != "OPTICAL_FLOW_RATE")
    {
        std::cerr << "UPPER_SNAKE_CASE projection mismatch\n";
        return false;
    }
    if (pythonToUpperSnakeCaseIdentifier("trailing ") != "TRAILING")
    {
        std::cerr << "UPPER_SNAKE_CASE trailing separator mismatch\n";
        return false;
    }

    if (pythonModuleStem("org.example.Config", "pkl") != "org_example_Config_pkl")
    {
        std::cerr << "module stem mismatch\n";
        return false;
    }
    if (pythonOutputFileName("Classes", "pkl") != "Classes_pkl.py")
    {
        std::cerr << "output file name mismatch\n";
        return false;
    }

    if (pythonQuote("plain") != "\"plain\"")
    {
        std::cerr << "plain quote mismatch\n";
        return false;
    }
    if (pythonQuote("a\"b\\c\nd") != "\"a\\\"b\\\\c\\nd\"")
    {
        std::cerr << "quote escaping mismatch\n";
        return false;
    }
    if (pythonQuote(std::string("\x01", 1)) != "\"\\x01\"")
    {
        std::cerr << "control character escaping mismatch\n";
        return false;
    }

    return true;
}
