#pragma once

#include <string>
#include <vector>

#include "core/execution_types.hpp"

namespace autom8_tui {

/**
 * 根据运行请求拼出剧本执行器的参数列表
 * 口令从不进入参数：vault 模式只追加 vault_password_arg（指向stdin的路径）
 */
class CommandBuilder {
public:
    explicit CommandBuilder(const ExecutionOptions& options) : options_(options) {}

    /** argv[0] 为配置的可执行文件名（未解析PATH） */
    std::vector<std::string> build_argv(const RunRequest& request) const;

    /** 供命令预览弹窗和日志使用的shell风格文本 */
    std::string preview(const RunRequest& request) const;

    static std::string join_limit(const std::vector<std::string>& hosts);
    static std::string shell_quote(const std::string& arg);

private:
    const ExecutionOptions& options_;
};

} // namespace autom8_tui
