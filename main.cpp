/**
 * @file main.cpp
 * @brief Entry point of the fieldplan command-line tool.
 */

#include "app/FieldPlanApp.hpp"

int main(int argc, char** argv) {
    fieldplan::app::FieldPlanApp app;
    return app.Run(argc, argv);
}
