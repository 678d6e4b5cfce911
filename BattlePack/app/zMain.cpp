/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - BattlePackTool CLI 主入口：解析参数、合并配置、分发子命令。
 * - 输入：battle pack 文件或 section_NN.bin 目录。
 * - 输出：导出的节文件 / 重新打包的容器 / 原位修改后的容器。
 */

// std::string。
#include <string>

// 日志。
#include "zLog.h"
// CLI 解析与 usage。
#include "zPipelineCli.h"
// 子命令分发。
#include "zPipelineRun.h"
// 配置结构与退出码。
#include "zPipelineTypes.h"

int main(int argc, char* argv[]) {
    bpk::CliOverrides cli;
    std::string error;
    if (!bpk::parseCommandLine(argc, argv, cli, error)) {
        LOGE("%s", error.c_str());
        bpk::printUsage();
        return bpk::kExitUsage;
    }
    if (cli.showHelp) {
        bpk::printUsage();
        return bpk::kExitOk;
    }

    bpk::BattlePackConfig config;
    if (!bpk::buildConfig(cli, config, error)) {
        LOGE("%s", error.c_str());
        bpk::printUsage();
        return bpk::kExitUsage;
    }
    return bpk::runBattlePack(config);
}
