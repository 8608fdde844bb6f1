#pragma once
#include "../tool.hpp"
#include "../config.hpp"
#include "../history/platform.hpp"
#include <memory>

namespace browsetrail {

class ChromeHistoryTool : public Tool {
public:
    explicit ChromeHistoryTool(HistoryConfig config,
                               std::unique_ptr<HostIdentity> identity =
                                   std::make_unique<CmdExeHostIdentity>());

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "chrome-hist-tool"; }
    std::string title() const override { return "fetch-chrome-history"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    HistoryConfig config_;
    std::unique_ptr<HostIdentity> identity_;
};

} // namespace browsetrail
