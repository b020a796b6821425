#include "GeoHandler.hpp"
#include "GeoEncoding.hpp"
#include "GeoErrors.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

GeoHandler::GeoHandler(std::ostream& out, std::ostream& err)
    : out(out), err(err) {}

bool GeoHandler::isGeoCommand(const std::string& cmd) {
    return cmd == "encode" || cmd == "decode" || cmd == "decode-with-error";
}

void GeoHandler::printUsage() {
    err << "usage: geohash encode <latitude> <longitude> [--length N]\n"
        << "       geohash decode <geohash>\n"
        << "       geohash decode-with-error <geohash>\n";
}

int GeoHandler::sendError(const std::string& message, int status) {
    err << "ERR " << message << "\n";
    return status;
}

int GeoHandler::handleCommand(const Command& cmd) {
    try {
        if (cmd.name == "encode") return handleEncode(cmd);
        if (cmd.name == "decode") return handleDecode(cmd);
        if (cmd.name == "decode-with-error") return handleDecodeWithError(cmd);
    } catch (const geohash::GeoError& e) {
        return sendError(e.what(), EXIT_FAILED);
    } catch (const std::runtime_error& e) {
        return sendError(e.what(), EXIT_USAGE);
    }
    printUsage();
    return sendError("unknown command '" + cmd.name + "'", EXIT_USAGE);
}

int GeoHandler::handleEncode(const Command& cmd) {
    if (cmd.args.size() != 2) {
        return sendError("encode requires latitude and longitude", EXIT_USAGE);
    }
    double latitude = parser.parseReal(cmd.args[0]);
    double longitude = parser.parseReal(cmd.args[1]);

    int length = geohash::DEFAULT_LENGTH;
    if (auto value = parser.option(cmd, "length")) {
        length = parser.parseInteger(*value);
    }

    out << geohash::encode(latitude, longitude, length) << "\n";
    return EXIT_OK;
}

int GeoHandler::handleDecode(const Command& cmd) {
    if (cmd.args.size() != 1) {
        return sendError("decode requires a geohash", EXIT_USAGE);
    }
    geohash::FormattedCoordinates coords = geohash::decode(cmd.args[0]);
    out << coords.latitude << " " << coords.longitude << "\n";
    return EXIT_OK;
}

int GeoHandler::handleDecodeWithError(const Command& cmd) {
    if (cmd.args.size() != 1) {
        return sendError("decode-with-error requires a geohash", EXIT_USAGE);
    }
    geohash::DecodedPosition pos = geohash::decode_with_error(cmd.args[0]);
    std::ostringstream posSs;
    posSs << std::setprecision(17)
          << pos.latitude << " " << pos.longitude << " "
          << pos.latitude_error << " " << pos.longitude_error;
    out << posSs.str() << "\n";
    return EXIT_OK;
}
