#pragma once

#include "cli/ICommand.hpp"

namespace batchfs {

class RenameCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "rename"; }
    const char* description() const override { return "Rename files to <stem>_<number>.<ext>"; }
    const char* helpNameLine() const override { return "rename -  Sequentially rename the files of a directory"; }
    const char* helpSynopsis() const override { return "batchfs rename <dir> <stem> [--padding <n>] [--start <n>]"; }
    const char* helpDescription() const override {
        return "Rename every file directly inside <dir> (subdirectories are left alone) to\n"
               "<stem>_<NNNNN><ext>, keeping each file's extension. Numbers are assigned in\n"
               "directory order. Existing files with a generated name are NOT protected.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--padding <n>", "Zero padding width of the number. Default: 5."},
            {"--start <n>", "First number of the sequence. Default: 0."}
        };
    }
};

}
