#include <iostream>

#include "eval/eval_app.h"

int main(int argc, const char **argv)
{
    return EvalApp::run(argc, argv, std::cout);
}
