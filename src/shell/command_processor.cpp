#include <geomark/shell/command_processor.hpp>

#include <geomark/datum/datum_registry.hpp>
#include <geomark/io/point_list.hpp>
#include <geomark/projection/utm_projection.hpp>
#include <geomark/types/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <ostream>

namespace
{
using namespace geomark;

double parseNumber(std::string text, const std::string &what)
{
    std::replace(text.begin(), text.end(), ',', '.');
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size())
    {
        throw std::invalid_argument(what + " must be a numeric value, got '" + text + "'");
    }
    return value;
}

std::string joinFrom(const std::vector<std::string> &args, size_t first)
{
    std::string joined;
    for (size_t i = first; i < args.size(); i++)
    {
        if (!joined.empty())
            joined += " ";
        joined += args[i];
    }
    return joined;
}

} // namespace

namespace geomark
{

std::vector<std::string> tokenizeCommandLine(const std::string &line)
{
    std::vector<std::string> tokens;
    std::string current;
    bool quoted = false, has_token = false;
    for (char c : line)
    {
        if (c == '"')
        {
            quoted = !quoted;
            has_token = true;
        }
        else if (!quoted && std::isspace(static_cast<unsigned char>(c)))
        {
            if (has_token)
                tokens.push_back(current);
            current.clear();
            has_token = false;
        }
        else
        {
            current += c;
            has_token = true;
        }
    }
    if (has_token)
        tokens.push_back(current);
    return tokens;
}

const std::vector<CommandProcessor::command_info> &CommandProcessor::commands()
{
    static const std::vector<command_info> table = {
        {"create", {"new", "n", "c"}, "create [name]", "Create a new empty KMZ in memory.", &CommandProcessor::create},
        {"open", {"load", "l", "o"}, "open <path>", "Open a KMZ file, .kmz is appended when missing.",
         &CommandProcessor::open},
        {"save",
         {"s"},
         "save [path]",
         "Save the KMZ. Without a path the last opened or saved path is reused.",
         &CommandProcessor::save},
        {"list",
         {"showpoints", "sp", "points", "listpoints", "lp"},
         "list",
         "List every point with its geographic and UTM coordinates.",
         &CommandProcessor::list},
        {"addlonlat",
         {"addlatlon", "al", "npl", "addclassic", "addll"},
         "addlonlat <name> <lat> <lon> [datum]",
         "Add a point from latitude and longitude in decimal degrees.",
         &CommandProcessor::addLonLat},
        {"addutm",
         {"au", "autm", "np", "add"},
         "addutm <name> <easting> <northing> <zone> [datum]",
         "Add a point from UTM coordinates, the zone includes its band letter (e.g. 30T).",
         &CommandProcessor::addUtm},
        {"addlist",
         {"addfile", "afl"},
         "addlist <path>",
         "Add every point of a text file with one 'name easting northing zone [datum]' per line.",
         &CommandProcessor::addList},
        {"delete", {"del", "dp", "remove"}, "delete <name>", "Delete a point.", &CommandProcessor::remove},
        {"modpoint",
         {"mp", "mpoint", "modp"},
         "modpoint rename <old> <new> | relocate <name> <lat> <lon> [datum] | relocateutm <name> <easting> "
         "<northing> <zone> [datum]",
         "Rename a point or move it to new coordinates.",
         &CommandProcessor::modPoint},
        {"distance",
         {},
         "distance <name1> <name2>",
         "Geodesic and UTM plane distance between two points.",
         &CommandProcessor::distance},
        {"distances",
         {"dist", "distline"},
         "distances [datum]",
         "Distances between consecutive points in the order they were added, plus the total.",
         &CommandProcessor::distances},
        {"distancesall",
         {"distall", "distanceall"},
         "distancesall [datum]",
         "Distances between every pair of points.",
         &CommandProcessor::distancesAll},
        {"setdatum",
         {"stdt", "setdt"},
         "setdatum <datum>",
         "Set the datum used when a command does not name one (WGS84, NAD83, ETRS89).",
         &CommandProcessor::setDatum},
        {"resetdatum", {"rstd", "resetdt"}, "resetdatum", "Reset the datum to the default.",
         &CommandProcessor::resetDatum},
        {"datum", {"dt"}, "datum", "Show the current datum.", &CommandProcessor::showDatum},
        {"status", {"stat", "st"}, "status", "Show the state of the session.", &CommandProcessor::status},
        {"help", {"?"}, "help [command]", "List commands or describe one.", &CommandProcessor::help},
        {"exit", {"quit", "q", "e", "x", "EOF"}, "exit", "Leave the shell.", &CommandProcessor::exit},
    };
    return table;
}

const CommandProcessor::command_info *CommandProcessor::findCommand(const std::string &name)
{
    for (const auto &command : commands())
    {
        if (command.name == name ||
            std::find(command.aliases.begin(), command.aliases.end(), name) != command.aliases.end())
        {
            return &command;
        }
    }
    return nullptr;
}

std::optional<std::string> CommandProcessor::resolveAlias(const std::string &name)
{
    const command_info *command = findCommand(name);
    if (command == nullptr)
        return std::nullopt;
    return command->name;
}

std::vector<std::string> CommandProcessor::commandNames()
{
    std::vector<std::string> names;
    for (const auto &command : commands())
        names.push_back(command.name);
    return names;
}

CommandProcessor::CommandProcessor(Session &session, std::ostream &out) : _session(session), _out(out)
{
}

bool CommandProcessor::execute(const std::string &line)
{
    const Arguments tokens = tokenizeCommandLine(line);
    if (tokens.empty())
        return true;

    const command_info *command = findCommand(tokens[0]);
    if (command == nullptr)
    {
        _out << "Unknown command: " << tokens[0] << std::endl;
        return true;
    }

    spdlog::debug("Executing '{}' as {}", line, command->name);

    const Arguments args(tokens.begin() + 1, tokens.end());
    try
    {
        (this->*(command->handler))(args);
    }
    catch (const GeomarkError &e)
    {
        _out << "Error: " << e.what() << std::endl;
    }
    catch (const std::invalid_argument &e)
    {
        _out << "Error: " << e.what() << std::endl;
    }

    return !_exit_requested;
}

bool CommandProcessor::confirmDiscard(const std::string &action)
{
    if (!_session.hasUnsavedChanges() || !_confirm)
        return true;

    if (_confirm("You have unsaved changes. Are you sure you want to " + action +
                 "?\nALL UNSAVED CHANGES WILL BE LOST (y/n): "))
        return true;

    _out << "Operation cancelled." << std::endl;
    return false;
}

DatumId CommandProcessor::datumArgument(const Arguments &args, size_t index) const
{
    if (index < args.size())
        return resolveDatumId(args[index]);
    return _session.defaultDatum();
}

void CommandProcessor::printPointLine(const Point &point)
{
    const GeographicCoordinate &c = point.coordinate;
    _out << " - " << point.name << ": lat " << std::setprecision(10) << c.latitude << ", lon " << c.longitude << " ("
         << datumIdToString(c.datum) << ")";
    if (std::abs(c.latitude) <= UTM_MAX_LATITUDE)
    {
        const UtmCoordinate utm = toUtm(c);
        _out << " | " << zoneTag(utm.zone) << " " << std::fixed << std::setprecision(2) << utm.easting << " E "
             << utm.northing << " N" << std::defaultfloat;
    }
    if (point.altitude.has_value())
        _out << " | alt " << std::setprecision(6) << *point.altitude << " m";
    _out << std::endl;
}

void CommandProcessor::printDistances(const std::vector<point_pair_distance> &distances)
{
    _out << std::fixed << std::setprecision(2);
    for (const auto &d : distances)
    {
        _out << " - " << d.from << " to " << d.to << ": " << d.meters << " meters" << std::endl;
    }
    _out << std::defaultfloat;
}

void CommandProcessor::create(const Arguments &args)
{
    if (!confirmDiscard("create a new KMZ"))
        return;

    _session.create(joinFrom(args, 0));
    _out << "New KMZ '" << _session.document().name << "' created in memory (not yet saved, use save <path>)."
         << std::endl;
}

void CommandProcessor::open(const Arguments &args)
{
    if (args.empty())
        throw std::invalid_argument("No file path provided. Usage: open <path>");
    if (!confirmDiscard("open another KMZ"))
        return;

    _session.open(joinFrom(args, 0));

    const ReadReport &report = _session.lastOpenReport();
    _out << "KMZ file " << *_session.filePath() << " loaded with " << report.accepted.size() << " points." << std::endl;
    for (const auto &skipped : report.skipped)
    {
        _out << "Skipped placemark '" << skipped.name << "': " << skipped.reason << std::endl;
    }
    for (const auto &defaulted : report.defaulted)
    {
        _out << "Defaulted " << defaulted << std::endl;
    }
}

void CommandProcessor::save(const Arguments &args)
{
    std::optional<std::string> path;
    if (!args.empty())
        path = joinFrom(args, 0);
    else if (_session.filePath().has_value())
        _out << "Last path recovered (" << *_session.filePath() << ")" << std::endl;

    const std::string written = _session.save(path);
    _out << "KMZ saved successfully to " << written << "." << std::endl;
}

void CommandProcessor::list(const Arguments &)
{
    const Document &document = _session.document();
    if (document.points.empty())
    {
        _out << "No points found in the KMZ." << std::endl;
        return;
    }

    _out << "Points in '" << document.name << "':" << std::endl;
    for (const Point &point : document.points)
    {
        printPointLine(point);
    }
}

void CommandProcessor::addLonLat(const Arguments &args)
{
    if (args.size() < 3 || args.size() > 4)
        throw std::invalid_argument("Invalid arguments. Usage: addlonlat <name> <lat> <lon> [datum]");

    Document &document = _session.document();
    const GeographicCoordinate coordinate{parseNumber(args[1], "Latitude"), parseNumber(args[2], "Longitude"),
                                          datumArgument(args, 3)};
    document.points.add(args[0], coordinate);
    _session.markModified();

    _out << "Point " << args[0] << " added at (lat: " << std::setprecision(10) << coordinate.latitude
         << ", lon: " << coordinate.longitude << ")." << std::endl;
}

void CommandProcessor::addUtm(const Arguments &args)
{
    if (args.size() < 4 || args.size() > 5)
        throw std::invalid_argument("Invalid arguments. Usage: addutm <name> <easting> <northing> <zone> [datum]");

    Document &document = _session.document();
    UtmCoordinate utm;
    utm.easting = parseNumber(args[1], "Easting");
    utm.northing = parseNumber(args[2], "Northing");
    utm.zone = parseZoneTag(args[3]);
    utm.datum = datumArgument(args, 4);

    document.points.addFromUtm(args[0], utm);
    _session.markModified();

    const GeographicCoordinate &c = document.points.get(args[0]).coordinate;
    _out << "Point " << args[0] << " added at (lat: " << std::setprecision(10) << c.latitude
         << ", lon: " << c.longitude << ") from UTM coordinates." << std::endl;
}

void CommandProcessor::addList(const Arguments &args)
{
    if (args.empty())
        throw std::invalid_argument("No file path provided. Usage: addlist <path>");

    Document &document = _session.document();
    const BulkImportReport report = importPointList(joinFrom(args, 0), document.points, _session.defaultDatum());
    if (!report.accepted.empty())
        _session.markModified();

    for (const auto &skipped : report.skipped)
    {
        _out << "Line " << skipped.line_number;
        if (!skipped.name.empty())
            _out << " (" << skipped.name << ")";
        _out << " skipped: " << skipped.reason << std::endl;
    }
    _out << report.accepted.size() << " points added, " << report.skipped.size() << " skipped." << std::endl;
}

void CommandProcessor::remove(const Arguments &args)
{
    if (args.size() != 1)
        throw std::invalid_argument("Invalid arguments. Usage: delete <name>");

    _session.document().points.remove(args[0]);
    _session.markModified();
    _out << "Point " << args[0] << " deleted successfully." << std::endl;
}

void CommandProcessor::modPoint(const Arguments &args)
{
    if (args.empty())
        throw std::invalid_argument("Invalid arguments. See 'help modpoint' for usage.");

    PointRegistry &points = _session.document().points;
    const std::string &subcommand = args[0];

    if (subcommand == "rename")
    {
        if (args.size() != 3)
            throw std::invalid_argument("Invalid arguments for rename. Usage: modpoint rename <old> <new>");
        points.rename(args[1], args[2]);
        _out << "Point renamed from " << args[1] << " to " << args[2] << "." << std::endl;
    }
    else if (subcommand == "relocate")
    {
        if (args.size() < 4 || args.size() > 5)
            throw std::invalid_argument(
                "Invalid arguments for relocate. Usage: modpoint relocate <name> <lat> <lon> [datum]");
        const GeographicCoordinate coordinate{parseNumber(args[2], "Latitude"), parseNumber(args[3], "Longitude"),
                                              datumArgument(args, 4)};
        points.move(args[1], coordinate);
        _out << "Point " << args[1] << " relocated to (lat: " << std::setprecision(10) << coordinate.latitude
             << ", lon: " << coordinate.longitude << ")." << std::endl;
    }
    else if (subcommand == "relocateutm")
    {
        if (args.size() < 5 || args.size() > 6)
            throw std::invalid_argument("Invalid arguments for relocateutm. Usage: modpoint relocateutm <name> "
                                        "<easting> <northing> <zone> [datum]");
        UtmCoordinate utm;
        utm.easting = parseNumber(args[2], "Easting");
        utm.northing = parseNumber(args[3], "Northing");
        utm.zone = parseZoneTag(args[4]);
        utm.datum = datumArgument(args, 5);
        points.moveFromUtm(args[1], utm);

        const GeographicCoordinate &c = points.get(args[1]).coordinate;
        _out << "Point " << args[1] << " relocated to (lat: " << std::setprecision(10) << c.latitude
             << ", lon: " << c.longitude << ") from UTM coordinates." << std::endl;
    }
    else
    {
        throw std::invalid_argument("Unknown subcommand '" + subcommand + "'. See 'help modpoint' for usage.");
    }
    _session.markModified();
}

void CommandProcessor::distance(const Arguments &args)
{
    if (args.size() != 2)
        throw std::invalid_argument("Invalid arguments. Usage: distance <name1> <name2>");

    const PointRegistry &points = _session.document().points;
    const Point &a = points.get(args[0]);
    const Point &b = points.get(args[1]);

    _out << std::fixed << std::setprecision(2) << "Distance " << a.name << " to " << b.name << ": "
         << geomark::distance(a, b) << " meters (geodesic, " << datumIdToString(b.coordinate.datum) << ")"
         << std::endl;
    if (std::abs(a.coordinate.latitude) <= UTM_MAX_LATITUDE && std::abs(b.coordinate.latitude) <= UTM_MAX_LATITUDE)
    {
        _out << "UTM plane distance: " << planarDistance(a, b) << " meters" << std::endl;
    }
    _out << std::defaultfloat;
}

void CommandProcessor::distances(const Arguments &args)
{
    const DatumId datum_id = datumArgument(args, 0);
    const std::vector<Point> &points = _session.document().points.list();
    if (points.size() < 2)
        throw std::invalid_argument("At least two points are required to calculate distances.");

    const auto line = distancesLine(points, datum_id);
    _out << "Distances are taken in the order the points were added, use distancesall for every pair." << std::endl;
    _out << "Distances between consecutive points (using datum " << datumIdToString(datum_id) << "):" << std::endl;
    printDistances(line);
    _out << std::fixed << std::setprecision(2) << "Total distance: " << totalDistance(line) << " meters"
         << std::defaultfloat << std::endl;
}

void CommandProcessor::distancesAll(const Arguments &args)
{
    const DatumId datum_id = datumArgument(args, 0);
    const std::vector<Point> &points = _session.document().points.list();
    if (points.size() < 2)
        throw std::invalid_argument("At least two points are required to calculate distances.");

    _out << "Distances between all points (using datum " << datumIdToString(datum_id) << "):" << std::endl;
    printDistances(geomark::distancesAll(points, datum_id));
}

void CommandProcessor::setDatum(const Arguments &args)
{
    if (args.empty())
        throw std::invalid_argument("No datum provided. Current datum is " +
                                    datumIdToString(_session.defaultDatum()) + ".");

    _session.setDefaultDatum(resolveDatumId(args[0]));
    _out << "Default datum set to " << datumIdToString(_session.defaultDatum()) << "." << std::endl;
}

void CommandProcessor::resetDatum(const Arguments &)
{
    _session.resetDefaultDatum();
    _out << "Datum reset to default (" << datumIdToString(_session.defaultDatum()) << ")." << std::endl;
}

void CommandProcessor::showDatum(const Arguments &)
{
    const DatumId current = _session.defaultDatum();
    const DatumId configured = _session.settings().default_datum;
    _out << "Current datum: " << datumIdToString(current);
    if (current == configured)
        _out << " (default)";
    else
        _out << " (changed from default " << datumIdToString(configured) << ")";
    _out << std::endl;
}

void CommandProcessor::status(const Arguments &args)
{
    _out << "=== GEOMARK STATUS ===" << std::endl;
    if (!_session.hasDocument())
    {
        _out << "No KMZ loaded or created. Use create or open <path> to begin." << std::endl;
    }
    else
    {
        const Document &document = _session.document();
        _out << "KMZ '" << document.name << "' with " << document.points.size() << " points";
        if (_session.filePath().has_value())
            _out << " (" << *_session.filePath() << ")";
        _out << "." << std::endl;
        if (_session.hasUnsavedChanges())
            _out << "There are unsaved changes. Use save <path> to preserve them." << std::endl;
        else
            _out << "No unsaved changes." << std::endl;
    }
    showDatum(args);
    _out << "======================" << std::endl;
}

void CommandProcessor::help(const Arguments &args)
{
    if (!args.empty())
    {
        const command_info *command = findCommand(args[0]);
        if (command == nullptr)
        {
            _out << "Unknown command: " << args[0] << std::endl;
            return;
        }
        _out << "Help for '" << command->name << "':" << std::endl;
        _out << "  " << command->description << std::endl;
        _out << "  Usage: " << command->usage << std::endl;
        if (!command->aliases.empty())
        {
            _out << "  Aliases:";
            for (const auto &alias : command->aliases)
                _out << " " << alias;
            _out << std::endl;
        }
        return;
    }

    std::vector<const command_info *> sorted;
    for (const auto &command : commands())
        sorted.push_back(&command);
    std::sort(sorted.begin(), sorted.end(),
              [](const command_info *a, const command_info *b) { return a->name < b->name; });

    _out << "List of available commands:" << std::endl;
    for (const command_info *command : sorted)
    {
        _out << "  " << std::left << std::setw(14) << command->name << std::right << command->usage << std::endl;
    }
    _out << "Type help <command> for specific help and aliases." << std::endl;
}

void CommandProcessor::exit(const Arguments &)
{
    if (!confirmDiscard("exit"))
        return;
    _out << "Exiting geomark..." << std::endl;
    _exit_requested = true;
}

} // namespace geomark
