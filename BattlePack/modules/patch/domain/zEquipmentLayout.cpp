#include "zEquipmentLayout.h"

#include "zSignatureScanner.h"

namespace bpk::patch {

const std::vector<uint8_t> kEquipmentSignature = {0x44, 0x71, 0x00};

zRecordArrayLayout flyingFlagLayout() {
    zRecordArrayLayout layout;
    layout.stride = kEquipmentRecordSize;
    layout.fieldOffset = kFlyingFlagOffset;
    layout.count = kEquipmentRecordCount;
    layout.mask = kFlyingFlagMask;
    return layout;
}

bool locateEquipmentArray(std::istream& stream,
                          zEquipmentArrayLocation* out,
                          base::zBpError* error,
                          const size_t chunkSize) {
    if (out == nullptr) {
        return base::setBpError(error, base::BpErrorCode::kContractViolation, "location output is null");
    }
    *out = zEquipmentArrayLocation();

    zSignatureMatch match;
    if (!locateSignature(stream, kEquipmentSignature, &match, error, chunkSize)) {
        return false;
    }
    if (match.found) {
        out->found = true;
        out->signatureOffset = match.offset;
        out->arrayBase = match.offset + kEquipmentOffsetFromSignature;
    }
    return true;
}

}  // namespace bpk::patch
