#pragma once
#include <llvm/Support/raw_ostream.h>

#define FIXEDPOLY_SHOWLN(ex) llvm::errs() << #ex << " = " << ex << "\n";
