/*

         sitescout - find the nearest radio sites from a GPS fix
            Copyright (C) 2026 Thomas A. Early N7TAE

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program; if not, write to the Free Software Foundation, Inc.,
51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*/

#include <string>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cmath>
#include <filesystem>

#include <getopt.h>

#include "Version.h"
#include "Configure.h"
#include "SiteCatalog.h"
#include "SourceFactory.h"
#include "FileSource.h"
#include "GpsWorker.h"
#include "Ranker.h"
#include "Report.h"
#include "Log.h"

// global defs
CConfigure g_Cfg;

static volatile std::sig_atomic_t caught_signal = 0;

static void sigHandler(int signum)
{
	caught_signal = signum;
}

// what the command line asked for, applied on top of the ini file
struct SOptions
{
	std::string config, gps, unit, device, file, save, csv, json, host, logFile;
	std::string range, count, timeout, port, baud, lat, lon;
	bool watch = false, debug = false, dump = false;
};

static void usage(const std::string &exename)
{
	std::cout << "Usage: " << exename << " [options]" << std::endl
		<< "  --gps {auto,gpsd,nmea,file,manual}  position source (default auto)" << std::endl
		<< "  --lat <deg> --lon <deg>             manual position" << std::endl
		<< "  --gps-host <host> --gps-port <port> gpsd address (default 127.0.0.1:2947)" << std::endl
		<< "  --gps-device <path> --baud <rate>   NMEA serial device" << std::endl
		<< "  --gps-file <path>                   position file" << std::endl
		<< "  --save-gps <path>                   save the acquired position" << std::endl
		<< "  --timeout <seconds>                 GPS timeout (default 10)" << std::endl
		<< "  --csv <path> | --json <path>        site catalog" << std::endl
		<< "  --unit {km,mi,nm}                   distance unit (default mi)" << std::endl
		<< "  --range <distance>                  search range (default 30)" << std::endl
		<< "  --count <n>                         length of the nearest list (default 10)" << std::endl
		<< "  --config <ini>                      configuration file" << std::endl
		<< "  --watch                             keep reporting until interrupted" << std::endl
		<< "  --debug                             debug output on the console" << std::endl
		<< "  --log-file <path>                   append every log line to this file" << std::endl
		<< "  --dump                              print the configuration and exit" << std::endl
		<< "  -v, --version | -h, --help" << std::endl;
}

// returns true on failure
static bool toNumber(const std::string &str, double &value)
{
	char *end = nullptr;
	value = std::strtod(str.c_str(), &end);
	return str.empty() or '\0' != *end or not std::isfinite(value);
}

// returns true on failure
static bool toUnsigned(const std::string &str, unsigned min, unsigned max, unsigned &value)
{
	double d;
	if (toNumber(str, d) or d < min or d > max or d != std::floor(d))
		return true;
	value = unsigned(d);
	return false;
}

// returns true on failure
static bool applyOptions(const SOptions &o)
{
	bool rval = false;
	auto bad = [&rval](const char *opt, const std::string &value) {
		std::cerr << "ERROR: bad value for " << opt << ": '" << value << "'" << std::endl;
		rval = true;
	};
	double d;
	unsigned u;

	if (not o.gps.empty())
		g_Cfg.SetString(g_Keys.gps.section, g_Keys.gps.source, o.gps);
	if (not o.host.empty())
		g_Cfg.SetString(g_Keys.gps.section, g_Keys.gps.host, o.host);
	if (not o.port.empty())
	{
		if (toUnsigned(o.port, 1u, 65535u, u))
			bad("--gps-port", o.port);
		else
			g_Cfg.SetUnsigned(g_Keys.gps.section, g_Keys.gps.port, u);
	}
	if (not o.device.empty())
		g_Cfg.SetString(g_Keys.gps.section, g_Keys.gps.device, o.device);
	if (not o.baud.empty())
	{
		if (toUnsigned(o.baud, 1u, 4000000u, u))
			bad("--baud", o.baud);
		else
			g_Cfg.SetUnsigned(g_Keys.gps.section, g_Keys.gps.baudRate, u);
	}
	if (not o.file.empty())
		g_Cfg.SetString(g_Keys.gps.section, g_Keys.gps.file, o.file);
	if (not o.timeout.empty())
	{
		if (toNumber(o.timeout, d) or d <= 0.0)
			bad("--timeout", o.timeout);
		else
			g_Cfg.SetFloat(g_Keys.gps.section, g_Keys.gps.timeout, float(d));
	}
	if (not o.csv.empty())
	{
		g_Cfg.SetString(g_Keys.sites.section, g_Keys.sites.csvPath, o.csv);
		g_Cfg.SetString(g_Keys.sites.section, g_Keys.sites.jsonPath, "");
	}
	if (not o.json.empty())
		g_Cfg.SetString(g_Keys.sites.section, g_Keys.sites.jsonPath, o.json);
	if (not o.unit.empty())
		g_Cfg.SetString(g_Keys.sites.section, g_Keys.sites.unit, o.unit);
	if (not o.range.empty())
	{
		if (toNumber(o.range, d) or d < 0.0)
			bad("--range", o.range);
		else
			g_Cfg.SetFloat(g_Keys.sites.section, g_Keys.sites.range, float(d));
	}
	if (not o.count.empty())
	{
		if (toUnsigned(o.count, 1u, 100000u, u))
			bad("--count", o.count);
		else
			g_Cfg.SetUnsigned(g_Keys.sites.section, g_Keys.sites.count, u);
	}
	if (not o.logFile.empty())
		g_Cfg.SetString(g_Keys.log.section, g_Keys.log.filePath, o.logFile);
	if (o.debug)
		g_Cfg.SetUnsigned(g_Keys.log.section, g_Keys.log.level, 1u);
	return rval;
}

static void troubleshooting(const std::string &exename)
{
	std::cout << std::endl << "No GPS position available!" << std::endl
		<< "  Is the receiver plugged in?  ls -la /dev/tty{USB,ACM}*" << std::endl
		<< "  Are you in the dialout group?  groups | grep dialout" << std::endl
		<< "  Is gpsd running and reporting?  gpspipe -w -n 10" << std::endl
		<< "  Or try manual coordinates:  " << exename << " --lat 44.9778 --lon -93.2650" << std::endl;
}

static void report(const CPosition &position, const CSiteCatalog &catalog, EUnit unit, double range, unsigned count)
{
	std::cout << std::endl << "=== Position ===" << std::endl;
	CReport::Position(std::cout, position);
	CReport::Grid(std::cout, position);

	std::cout << std::endl << "=== Using " << CGeoMath::UnitLabel(unit) << " ===" << std::endl << std::endl;
	SRankedSite nearest;
	if (CRanker::Closest(position, catalog, unit, nearest))
	{
		std::cout << "The site catalog is empty" << std::endl;
		return;
	}
	std::cout << "Nearest site:" << std::endl;
	CReport::SiteDetail(std::cout, nearest, unit);

	const auto inrange = CRanker::WithinRange(position, catalog, unit, range);
	std::cout << std::endl << "Found " << inrange.size() << " sites within " << range << ' ' << CGeoMath::UnitName(unit) << std::endl;

	const auto list = CRanker::Nearest(position, catalog, unit, count);
	std::cout << std::endl << "Top " << list.size() << " nearest sites:" << std::endl;
	CReport::NearestList(std::cout, list, unit);
}

int main(int argc, char** argv)
{
	const std::string exename(std::filesystem::path(argv[0]).filename());

	static const struct option longopts[] = {
		{ "gps",        required_argument, nullptr, 'g' },
		{ "unit",       required_argument, nullptr, 'u' },
		{ "range",      required_argument, nullptr, 'r' },
		{ "lat",        required_argument, nullptr, 'a' },
		{ "lon",        required_argument, nullptr, 'o' },
		{ "gps-device", required_argument, nullptr, 'd' },
		{ "gps-file",   required_argument, nullptr, 'f' },
		{ "save-gps",   required_argument, nullptr, 's' },
		{ "csv",        required_argument, nullptr, 'c' },
		{ "json",       required_argument, nullptr, 'j' },
		{ "count",      required_argument, nullptr, 'n' },
		{ "timeout",    required_argument, nullptr, 't' },
		{ "gps-host",   required_argument, nullptr, 'H' },
		{ "gps-port",   required_argument, nullptr, 'P' },
		{ "baud",       required_argument, nullptr, 'b' },
		{ "config",     required_argument, nullptr, 'C' },
		{ "log-file",   required_argument, nullptr, 'l' },
		{ "watch",      no_argument,       nullptr, 'w' },
		{ "debug",      no_argument,       nullptr, 'D' },
		{ "dump",       no_argument,       nullptr, 'U' },
		{ "version",    no_argument,       nullptr, 'v' },
		{ "help",       no_argument,       nullptr, 'h' },
		{ nullptr,      0,                 nullptr,  0  }
	};

	SOptions opts;
	int c;
	while (-1 != (c = getopt_long(argc, argv, "vh", longopts, nullptr)))
	{
		switch (c)
		{
			case 'g': opts.gps.assign(optarg);     break;
			case 'u': opts.unit.assign(optarg);    break;
			case 'r': opts.range.assign(optarg);   break;
			case 'a': opts.lat.assign(optarg);     break;
			case 'o': opts.lon.assign(optarg);     break;
			case 'd': opts.device.assign(optarg);  break;
			case 'f': opts.file.assign(optarg);    break;
			case 's': opts.save.assign(optarg);    break;
			case 'c': opts.csv.assign(optarg);     break;
			case 'j': opts.json.assign(optarg);    break;
			case 'n': opts.count.assign(optarg);   break;
			case 't': opts.timeout.assign(optarg); break;
			case 'H': opts.host.assign(optarg);    break;
			case 'P': opts.port.assign(optarg);    break;
			case 'b': opts.baud.assign(optarg);    break;
			case 'C': opts.config.assign(optarg);  break;
			case 'l': opts.logFile.assign(optarg); break;
			case 'w': opts.watch = true;           break;
			case 'D': opts.debug = true;           break;
			case 'U': opts.dump = true;            break;
			case 'v':
				std::cout << exename << " version " << g_Version << std::endl;
				return EXIT_SUCCESS;
			case 'h':
				usage(exename);
				return EXIT_SUCCESS;
			default:
				usage(exename);
				return EXIT_FAILURE;
		}
	}
	if (optind < argc)
	{
		std::cerr << "ERROR: unexpected argument '" << argv[optind] << "'" << std::endl;
		usage(exename);
		return EXIT_FAILURE;
	}

	// manual coordinates
	SSourceSettings settings;
	if (not opts.lat.empty() or not opts.lon.empty())
	{
		if (toNumber(opts.lat, settings.latitude) or toNumber(opts.lon, settings.longitude))
		{
			std::cerr << "ERROR: --lat and --lon need to be given together, in decimal degrees" << std::endl;
			return EXIT_FAILURE;
		}
		settings.haveManual = true;
		if (opts.gps.empty())
			opts.gps.assign("manual");
	}

	if (not opts.config.empty() and g_Cfg.ReadData(opts.config))
		return EXIT_FAILURE;
	if (applyOptions(opts) or g_Cfg.Validate())
		return EXIT_FAILURE;

	if (opts.dump)
	{
		g_Cfg.Dump();
		return EXIT_SUCCESS;
	}

	if (g_Log.Open(g_Cfg.GetString(g_Keys.log.section, g_Keys.log.filePath), g_Cfg.GetUnsigned(g_Keys.log.section, g_Keys.log.level)))
	{
		::fprintf(stderr, "ERROR: unable to open the log file\n");
		return EXIT_FAILURE;
	}

	LogInfo("%s-%s is starting", exename.c_str(), g_Version.c_str());
	LogInfo("Built %s %s", __TIME__, __DATE__);

	EUnit unit;
	if (CGeoMath::ParseUnit(g_Cfg.GetString(g_Keys.sites.section, g_Keys.sites.unit), unit))
	{
		g_Log.Close();
		return EXIT_FAILURE;
	}
	const double range   = g_Cfg.GetFloat(g_Keys.sites.section, g_Keys.sites.range);
	const unsigned count = g_Cfg.GetUnsigned(g_Keys.sites.section, g_Keys.sites.count);
	const double timeout = g_Cfg.GetFloat(g_Keys.gps.section, g_Keys.gps.timeout);

	// the site catalog
	CSiteCatalog catalog;
	const auto jsonpath = g_Cfg.GetString(g_Keys.sites.section, g_Keys.sites.jsonPath);
	const auto csvpath  = g_Cfg.GetString(g_Keys.sites.section, g_Keys.sites.csvPath);
	if (jsonpath.empty() ? catalog.LoadCSV(csvpath) : catalog.LoadJSON(jsonpath))
	{
		std::cerr << "ERROR: could not load the site catalog " << (jsonpath.empty() ? csvpath : jsonpath) << std::endl;
		g_Log.Close();
		return EXIT_FAILURE;
	}
	std::cout << "Loaded " << catalog.Size() << " sites from " << (jsonpath.empty() ? csvpath : jsonpath) << std::endl;
	if (not catalog.GetWarnings().empty())
		std::cout << catalog.GetWarnings().size() << " records were skipped, see the log for details" << std::endl;

	// the position source
	if (ParseSourceType(g_Cfg.GetString(g_Keys.gps.section, g_Keys.gps.source), settings.type))
	{
		g_Log.Close();
		return EXIT_FAILURE;
	}
	settings.host        = g_Cfg.GetString(g_Keys.gps.section, g_Keys.gps.host);
	settings.port        = uint16_t(g_Cfg.GetUnsigned(g_Keys.gps.section, g_Keys.gps.port));
	settings.device      = g_Cfg.GetString(g_Keys.gps.section, g_Keys.gps.device);
	settings.baud        = g_Cfg.GetUnsigned(g_Keys.gps.section, g_Keys.gps.baudRate);
	settings.file        = g_Cfg.GetString(g_Keys.gps.section, g_Keys.gps.file);
	settings.autoTimeout = g_Cfg.GetFloat(g_Keys.gps.section, g_Keys.gps.autoTimeout);

	auto source = MakeSource(settings);
	if (nullptr == source)
	{
		g_Log.Close();
		return EXIT_FAILURE;
	}
	source->SetObserver([](ESourceEvent event, const std::string &text) {
		LogDebug("%s: %s", ToString(event), text.c_str());
	});
	LogInfo("Position source is %s, timeout %.1f s", source->GetName().c_str(), timeout);

	int rval = EXIT_FAILURE;
	if (opts.watch)
	{
		std::signal(SIGINT,  sigHandler);
		std::signal(SIGTERM, sigHandler);

		CGpsWorker worker;
		if (worker.Start(std::move(source), timeout))
		{
			g_Log.Close();
			return EXIT_FAILURE;
		}
		while (0 == caught_signal)
		{
			auto fix = worker.WaitFor(250);
			if (nullptr == fix)
				continue;
			if (EAcquireError::none == fix->status)
			{
				report(*fix->position, catalog, unit, range, count);
				if (not opts.save.empty() and CFileSource::Save(opts.save, *fix->position))
					LogWarning("The position was not saved");
				rval = EXIT_SUCCESS;
			}
			else
				LogWarning("%s", ToString(fix->status));
		}
		worker.Stop();
		LogInfo("%s exited on receipt of signal %d", exename.c_str(), int(caught_signal));
	}
	else
	{
		std::unique_ptr<CPosition> position;
		auto err = source->Acquire(timeout, position);
		if (EAcquireError::none == err)
		{
			report(*position, catalog, unit, range, count);
			if (opts.save.empty() or not CFileSource::Save(opts.save, *position))
				rval = EXIT_SUCCESS;
		}
		else
		{
			LogError("%s", ToString(err));
			troubleshooting(exename);
		}
	}

	g_Log.Close();
	return rval;
}
