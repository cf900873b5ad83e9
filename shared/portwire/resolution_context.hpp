#pragma once
#include <string>
#include <unordered_set>
#include <vector>

namespace portwire {

    // Ports currently being constructed by one resolve chain.
    class ResolutionContext
    {
    public:
        // Throws CircularDependencyError when `port_name` is already in progress.
        void enter(const std::string& port_name);
        void exit(const std::string& port_name);

        const std::vector<std::string>& path() const { return path_; }
        size_t depth() const { return path_.size(); }

        // port whose construction triggered the current one, empty at the top
        std::string current() const { return path_.empty() ? std::string() : path_.back(); }

        // enter() on construction, exit() on destruction
        class Frame
        {
        public:
            Frame(ResolutionContext& context, const std::string& port_name)
                : context_(context), port_name_(port_name) { context_.enter(port_name_); }
            ~Frame() { context_.exit(port_name_); }

            Frame(const Frame&) = delete;
            Frame& operator=(const Frame&) = delete;

        private:
            ResolutionContext& context_;
            std::string port_name_;
        }; // class Frame

    private:
        std::unordered_set<std::string> in_progress_;
        std::vector<std::string> path_;
    }; // class ResolutionContext

}; // namespace portwire
