#pragma once

#include "cli/ICommand.hpp"

namespace batchfs {

class ListCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "list"; }
    const char* description() const override { return "Write a delimited list of a directory's files"; }
    const char* helpNameLine() const override { return "list -  Create a file manifest"; }
    const char* helpSynopsis() const override {
        return "batchfs list <dir> [--mode simple|full] [--output <path>] [--sep <separator>]";
    }
    const char* helpDescription() const override {
        return "Write one line per file directly inside <dir> to the output file, which is\n"
               "truncated first.\n\n"
               "  simple   header 'file_name', then one file name per line\n"
               "  full     header 'location,filename,size,last_modified', then the directory,\n"
               "           file name, size in bytes and modification time in epoch seconds";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--mode <simple|full>", "Columns to write. Default: simple."},
            {"--output <path>", "Manifest file to write. Default: files_list.csv."},
            {"--sep <separator>", "Field separator. '\\t' is accepted for a tab. Default: ','."}
        };
    }
};

}
