/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 装备记录数组的发现步骤与布局常量。
 * - 数组在节表中没有声明偏移，只能依靠特征串定位；
 *   格式变体需要不同特征串/偏移时只改本文件。
 */
#ifndef BPK_PATCH_EQUIPMENT_LAYOUT_H
#define BPK_PATCH_EQUIPMENT_LAYOUT_H

#include "zError.h"
#include "zRecordArrayPatcher.h"
#include "zSignatureScanner.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace bpk::patch {

// 装备数组前的标记字节。
extern const std::vector<uint8_t> kEquipmentSignature;
// 特征串起点到数组首条记录的距离。
constexpr uint64_t kEquipmentOffsetFromSignature = 8;
// 单条装备记录字节数。
constexpr uint64_t kEquipmentRecordSize = 52;
// 装备记录条数。
constexpr uint32_t kEquipmentRecordCount = 200;
// “可攻击飞行单位”标志所在字节（记录内偏移）。
constexpr uint64_t kFlyingFlagOffset = 7;
// “可攻击飞行单位”标志位。
constexpr uint8_t kFlyingFlagMask = 0x04;

// 装备数组定位结果。
struct zEquipmentArrayLocation {
    bool found = false;
    // 命中的特征串偏移。
    uint64_t signatureOffset = 0;
    // 数组首条记录偏移（signatureOffset + kEquipmentOffsetFromSignature）。
    uint64_t arrayBase = 0;
};

// “可攻击飞行单位”标志在装备数组中的布局。
zRecordArrayLayout flyingFlagLayout();

/**
 * @brief 在容器流中定位装备数组。
 * @return 读失败返回 IOFailure；未命中返回 true 且 out->found=false。
 */
bool locateEquipmentArray(std::istream& stream,
                          zEquipmentArrayLocation* out,
                          base::zBpError* error,
                          size_t chunkSize = kDefaultScanChunkSize);

}  // namespace bpk::patch

#endif // BPK_PATCH_EQUIPMENT_LAYOUT_H
