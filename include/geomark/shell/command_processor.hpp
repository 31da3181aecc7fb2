#pragma once

#include <geomark/distance/distance.hpp>
#include <geomark/session/session.hpp>

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace geomark
{

// failed commands print "Error: <message>" and never end the session
class CommandProcessor
{
  public:
    using Arguments = std::vector<std::string>;

    // asked before discarding unsaved changes, returning false cancels the command
    using ConfirmCallback = std::function<bool(const std::string &question)>;

    CommandProcessor(Session &session, std::ostream &out);

    void setConfirmCallback(ConfirmCallback confirm)
    {
        _confirm = std::move(confirm);
    }

    // returns false once an exit command has been accepted
    bool execute(const std::string &line);

    // canonical command name for a command or alias
    static std::optional<std::string> resolveAlias(const std::string &name);
    static std::vector<std::string> commandNames();

  private:
    using Handler = void (CommandProcessor::*)(const Arguments &);

    struct command_info
    {
        std::string name;
        std::vector<std::string> aliases;
        std::string usage;
        std::string description;
        Handler handler;
    };

    static const std::vector<command_info> &commands();
    static const command_info *findCommand(const std::string &name);

    void create(const Arguments &args);
    void open(const Arguments &args);
    void save(const Arguments &args);
    void list(const Arguments &args);
    void addLonLat(const Arguments &args);
    void addUtm(const Arguments &args);
    void addList(const Arguments &args);
    void remove(const Arguments &args);
    void modPoint(const Arguments &args);
    void distance(const Arguments &args);
    void distances(const Arguments &args);
    void distancesAll(const Arguments &args);
    void setDatum(const Arguments &args);
    void resetDatum(const Arguments &args);
    void showDatum(const Arguments &args);
    void status(const Arguments &args);
    void help(const Arguments &args);
    void exit(const Arguments &args);

    bool confirmDiscard(const std::string &action);
    DatumId datumArgument(const Arguments &args, size_t index) const;
    void printPointLine(const Point &point);
    void printDistances(const std::vector<point_pair_distance> &distances);

    Session &_session;
    std::ostream &_out;
    ConfirmCallback _confirm;
    bool _exit_requested = false;
};

// splits on whitespace, double quotes group words into one argument
std::vector<std::string> tokenizeCommandLine(const std::string &line);

} // namespace geomark
