#include <termpane/session.hpp>

namespace termpane
{

std::string default_session_title(const std::optional<std::string>& working_directory)
{
    if (!working_directory || working_directory->empty())
        return "Terminal";

    std::string path = *working_directory;
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();

    auto slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    if (last.empty())
        return path == "/" ? std::string("/") : std::string("Terminal");
    return last;
}

std::string shell_quote(const std::string& path)
{
    std::string out;
    out.reserve(path.size() + 2);
    out += '\'';
    for (char c : path)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += '\'';
    return out;
}

std::string change_directory_command(const std::string& path)
{
    return "cd " + shell_quote(path) + " && clear\n";
}

}   // namespace termpane
