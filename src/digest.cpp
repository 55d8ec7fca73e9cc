#include "posixc/digest.hpp"
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/SHA256.h>

namespace posixc {

std::string sha256_hex(const std::string& text){
    llvm::SHA256 hasher;
    hasher.update(llvm::StringRef(text));
    return llvm::toHex(hasher.final(), /*LowerCase*/true);
}

} // namespace posixc
