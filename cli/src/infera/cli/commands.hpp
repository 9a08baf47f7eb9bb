#pragma once

#include "infera/cli/parser/action.hpp"

int info(const InfoAction &action);
int run(const RunAction &action);
int demo(const DemoAction &action);
