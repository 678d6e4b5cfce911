// 引入主流程声明。
#include "zPipelineRun.h"

// 引入日志接口。
#include "zLog.h"
// 引入 patch 流程。
#include "zPipelinePatch.h"
// 引入 repack 流程。
#include "zPipelineRepack.h"
// 引入 unpack 流程。
#include "zPipelineUnpack.h"

namespace bpk {

int runBattlePack(const BattlePackConfig& config) {
    base::zBpError error;
    bool ok = false;
    switch (config.command) {
        case BattlePackCommand::kUnpack:
            ok = unpackBattlePack(config.containerPath, config.outputDir, &error);
            break;
        case BattlePackCommand::kRepack:
            ok = repackBattlePack(config.inputDir, config.outputPath, &error);
            break;
        case BattlePackCommand::kPatchFlyingFlag: {
            FlyingFlagPatchSummary summary;
            ok = patchFlyingFlag(config.containerPath, &summary, &error);
            break;
        }
        case BattlePackCommand::kNone:
            LOGE("no command given");
            return kExitUsage;
    }
    if (ok) {
        return kExitOk;
    }
    // 失败：输出错误分类与具体原因。
    LOGE("%s: %s",
         base::bpErrorCodeName(error.code),
         error.message.empty() ? "(unknown)" : error.message.c_str());
    const int exitCode = exitCodeForError(error);
    // ok=false 但未填错误码属于内部缺陷，不能返回 0。
    return exitCode == kExitOk ? kExitIoFailure : exitCode;
}

}  // namespace bpk
