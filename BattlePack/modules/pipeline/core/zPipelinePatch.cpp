#include "zPipelinePatch.h"

#include "zEquipmentLayout.h"
#include "zFile.h"
#include "zLog.h"
#include "zRecordArrayPatcher.h"

#include <fstream>

namespace bpk {

bool patchFlyingFlag(const std::string& containerPath,
                     FlyingFlagPatchSummary* summary,
                     base::zBpError* error) {
    if (summary != nullptr) {
        *summary = FlyingFlagPatchSummary();
    }
    if (!base::file::fileExists(containerPath)) {
        return base::setBpError(error, base::BpErrorCode::kNotFound,
                                "battle pack not found: " + containerPath);
    }

    // 同一个句柄同时负责扫描与读改写。
    std::fstream file(containerPath, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return base::setBpError(error, base::BpErrorCode::kContainerOpenFailure,
                                "unable to open file for read/write: " + containerPath);
    }

    patch::zEquipmentArrayLocation location;
    if (!patch::locateEquipmentArray(file, &location, error)) {
        return false;
    }
    if (!location.found) {
        return base::setBpError(error, base::BpErrorCode::kSignatureNotFound,
                                "unable to find the equipment section within the battle pack: " + containerPath);
    }
    LOGI("Located equipment array: signature=0x%llx base=0x%llx",
         static_cast<unsigned long long>(location.signatureOffset),
         static_cast<unsigned long long>(location.arrayBase));

    uint32_t patched = 0;
    const bool ok = patch::setRecordFlagBits(file, location.arrayBase, patch::flyingFlagLayout(), &patched, error);
    if (summary != nullptr) {
        summary->signatureOffset = location.signatureOffset;
        summary->arrayBase = location.arrayBase;
        summary->recordsPatched = patched;
    }
    if (!ok) {
        if (error != nullptr) {
            error->message = "patch aborted after " + std::to_string(patched) + " records: " + error->message;
        }
        return false;
    }

    LOGI("Made all weapons in battle pack able to hit flying enemies (%u records).", patched);
    base::clearBpError(error);
    return true;
}

}  // namespace bpk
