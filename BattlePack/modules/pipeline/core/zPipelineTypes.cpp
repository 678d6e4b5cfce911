// 引入 pipeline 类型定义。
#include "zPipelineTypes.h"

// 引入路径处理。
#include <filesystem>

namespace bpk {

int exitCodeForError(const base::zBpError& error) {
    switch (error.code) {
        case base::BpErrorCode::kNone:
            return kExitOk;
        case base::BpErrorCode::kNotFound:
            return kExitMissingInput;
        case base::BpErrorCode::kDirectoryFailure:
            return kExitDirectoryFailure;
        case base::BpErrorCode::kFormatError:
        case base::BpErrorCode::kContainerOpenFailure:
            return kExitContainerFormat;
        case base::BpErrorCode::kIoFailure:
            return kExitIoFailure;
        case base::BpErrorCode::kContractViolation:
            return kExitContractViolation;
        case base::BpErrorCode::kSignatureNotFound:
            return kExitSignatureNotFound;
    }
    return kExitIoFailure;
}

std::string defaultUnpackDirectory(const std::string& containerPath) {
    std::filesystem::path path(containerPath);
    path.replace_extension(".unpacked");
    return path.string();
}

}  // namespace bpk
