#ifndef PARSER_H_
#define PARSER_H_

#include "args.h"

class Parser {
  public:
    // Returns false when the program should exit, e.g. after --help or on an
    // invalid option. Messages are already printed.
    static bool ParseArgs(int argc, char *argv[], Args &args);
};

#endif // PARSER_H_
