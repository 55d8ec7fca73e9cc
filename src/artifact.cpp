#include "posixc/artifact.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

namespace posixc {

static Diagnostic write_failure(const std::string& path, const std::string& what, const std::error_code& ec){
    return make_error(DiagnosticKind::ValidationFailure, "E0413",
                      "cannot write '" + path + "': " + what + ": " + ec.message(),
                      "check that the output directory exists and is writable", SourceSpan{});
}

std::optional<Diagnostic> write_artifact(const std::string& path, const std::string& text){
    llvm::SmallString<256> dir(path);
    llvm::sys::path::remove_filename(dir);
    if(dir.empty()) dir = ".";

    llvm::SmallString<256> model(dir);
    llvm::sys::path::append(model, llvm::sys::path::filename(path) + ".tmp-%%%%%%");

    int fd = -1;
    llvm::SmallString<256> tmp;
    if(auto ec = llvm::sys::fs::createUniqueFile(model, fd, tmp)) return write_failure(path, "temporary file", ec);
    llvm::FileRemover remover(tmp);

    {
        llvm::raw_fd_ostream os(fd, /*shouldClose*/true);
        os << text;
        os.close();
        if(os.has_error()){
            std::error_code ec = os.error();
            os.clear_error();
            return write_failure(path, "write", ec);
        }
    }

    const auto mode = static_cast<llvm::sys::fs::perms>(llvm::sys::fs::owner_all | llvm::sys::fs::group_read |
                                                        llvm::sys::fs::group_exe | llvm::sys::fs::others_read |
                                                        llvm::sys::fs::others_exe);
    if(auto ec = llvm::sys::fs::setPermissions(tmp, mode)) return write_failure(path, "permissions", ec);
    if(auto ec = llvm::sys::fs::rename(tmp, path)) return write_failure(path, "rename", ec);
    remover.releaseFile();
    return std::nullopt;
}

} // namespace posixc
