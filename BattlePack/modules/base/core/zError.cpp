// 引入错误模型声明。
#include "zError.h"

namespace bpk::base {

const char* bpErrorCodeName(const BpErrorCode code) {
    switch (code) {
        case BpErrorCode::kNone:
            return "None";
        case BpErrorCode::kNotFound:
            return "NotFound";
        case BpErrorCode::kIoFailure:
            return "IOFailure";
        case BpErrorCode::kDirectoryFailure:
            return "DirectoryFailure";
        case BpErrorCode::kFormatError:
            return "FormatError";
        case BpErrorCode::kSignatureNotFound:
            return "SignatureNotFound";
        case BpErrorCode::kContractViolation:
            return "ContractViolation";
        case BpErrorCode::kContainerOpenFailure:
            return "ContainerOpenFailure";
    }
    return "Unknown";
}

bool setBpError(zBpError* error, const BpErrorCode code, const std::string& message) {
    // 调用方不关心细节时允许传空。
    if (error != nullptr) {
        error->code = code;
        error->message = message;
    }
    return false;
}

void clearBpError(zBpError* error) {
    if (error != nullptr) {
        error->code = BpErrorCode::kNone;
        error->message.clear();
    }
}

}  // namespace bpk::base
