#pragma once

#include "cli/ICommand.hpp"

namespace batchfs {

class CopyCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "copy"; }
    const char* description() const override { return "Copy files from a tree into one directory"; }
    const char* helpNameLine() const override { return "copy -  Recursively copy files into a flat directory"; }
    const char* helpSynopsis() const override {
        return "batchfs copy <src> <dest> [--ext <ext>] [--max-attempts <n>] [--preserve-times]";
    }
    const char* helpDescription() const override {
        return "Walk <src> and all of its subdirectories and copy every file whose extension matches\n"
               "<ext> (case-insensitive) into <dest>. Directory structure is flattened. When a name is\n"
               "already taken in <dest> a number is inserted before the extension (photo0.jpg,\n"
               "photo1.jpg, ...); existing files are never overwritten. <dest> must already exist.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--ext <ext>", "Only copy files with this extension (leading dot optional). Default: all files."},
            {"--max-attempts <n>", "Numbered names to try per file before failing. Default: 100000."},
            {"--preserve-times", "Copy the source modification time onto each copy."}
        };
    }
};

}
