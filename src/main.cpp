#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <exception>

#include "config/Settings.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"
#include "services/FleetService.hpp"
#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "util/JsonViews.hpp"

static void printJson(const QJsonDocument& doc)
{
		QTextStream out(stdout);
		out << doc.toJson(QJsonDocument::Indented);
		out.flush();
}

static void printJson(const QJsonObject& o) { printJson(QJsonDocument(o)); }
static void printJson(const QJsonArray& a)  { printJson(QJsonDocument(a)); }

static QJsonObject reportJson(const ScanCycleReport& r)
{
		QJsonObject o;
		o["boards"]               = JsonViews::toJsonArray(r.results);
		o["transitions"]          = QJsonArray::fromStringList(r.transitions);
		o["log_failures"]         = QJsonArray::fromStringList(r.logFailures);
		o["registry_changed"]     = r.registryChanged;
		o["registry_save_failed"] = r.registrySaveFailed;
		if (!r.registryLoaded) o["registry_load_failed"] = true;
		return o;
}

static int intOption(const QCommandLineParser& p, const QString& name, int fallback)
{
		bool ok = false;
		const int v = p.value(name).toInt(&ok);
		return ok ? v : fallback;
}

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName(QStringLiteral("cactus_flasherd"));

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"flasher.scan.debug=false\n"
						"flasher.discover.debug=false\n"
						"flasher.ota.debug=false\n"
						"flasher.store.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription(QStringLiteral("Fleet liveness and firmware delivery"));
				parser.addHelpOption();
				parser.addPositionalArgument(QStringLiteral("command"),
						QStringLiteral("scan | ping <name> | discover | flash <name> <firmware.bin> | "
									   "status-log | events | daemon"));

				const QCommandLineOption configDirOpt(QStringLiteral("config-dir"),
						QStringLiteral("Configuration directory."), QStringLiteral("dir"));
				const QCommandLineOption autoRegisterOpt(QStringLiteral("auto-register"),
						QStringLiteral("Register new boards found by discover."));
				const QCommandLineOption streamOpt(QStringLiteral("stream"),
						QStringLiteral("Stream the image as a raw body in fixed-size chunks."));
				const QCommandLineOption limitOpt(QStringLiteral("limit"),
						QStringLiteral("Maximum number of entries."), QStringLiteral("n"), QStringLiteral("50"));
				const QCommandLineOption deviceOpt(QStringLiteral("device"),
						QStringLiteral("Only entries of this board."), QStringLiteral("name"));
				const QCommandLineOption minLevelOpt(QStringLiteral("min-level"),
						QStringLiteral("Minimum event level 0-4."), QStringLiteral("level"), QStringLiteral("0"));
				const QCommandLineOption tagOpt(QStringLiteral("tag"),
						QStringLiteral("Event tag filter (SQL LIKE)."), QStringLiteral("tag"));
				const QCommandLineOption verboseOpt(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
						QStringLiteral("Enable debug categories."));
				parser.addOptions({configDirOpt, autoRegisterOpt, streamOpt, limitOpt, deviceOpt,
								   minLevelOpt, tagOpt, verboseOpt});
				parser.process(app);

				if (parser.isSet(verboseOpt))
						QLoggingCategory::setFilterRules(QStringLiteral("flasher.*.debug=true"));

				const QStringList args = parser.positionalArguments();
				if (args.isEmpty()) {
						parser.showHelp(1);
				}
				const QString command = args.first();

				const Settings settings = Settings::load(parser.value(configDirOpt));
				Logger::setDirectory(settings.logDir.toStdString());
				SqlCommon::setDbFilePath(settings.dbFile);

				QSqliteService svc;
				if (!svc.initializeDatabase()) {
						qCritical() << "[main] database init failed:" << settings.dbFile;
						return -1;
				}

				SystemLogger::init();
				SystemLogger::info("APP", QStringLiteral("cactus_flasherd %1").arg(command));

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [] {
						SystemLogger::info("APP", "aboutToQuit");
						SystemLogger::shutdown();
				});

				if (command == QLatin1String("events")) {
						QVector<SystemLogRow> rows;
						int total = 0;
						if (!svc.selectSystemLogs(0, intOption(parser, limitOpt.names().first(), 50),
												  intOption(parser, minLevelOpt.names().first(), 0),
												  parser.value(tagOpt), QString(), &rows, &total)) {
								SystemLogger::shutdown();
								return 1;
						}
						QJsonArray arr;
						for (const SystemLogRow& r : rows)
								arr.append(r.toJson());
						printJson(QJsonObject{ {"total", total}, {"events", arr} });
						SystemLogger::shutdown();
						return 0;
				}

				FleetService fleet(settings);

				if (command == QLatin1String("status-log")) {
						const QList<StatusLogEntry> entries =
								fleet.statusLog(intOption(parser, limitOpt.names().first(), 50), parser.value(deviceOpt));
						printJson(JsonViews::toJsonArray(entries));
						SystemLogger::shutdown();
						return 0;
				}

				int exitCode = 0;

				if (command == QLatin1String("scan")) {
						QObject::connect(&fleet, &FleetService::scanCycleFinished, &app,
										 [&exitCode](const ScanCycleReport& r) {
								printJson(reportJson(r));
								exitCode = r.registrySaveFailed ? 2 : 0;
								QCoreApplication::quit();
						});
						QTimer::singleShot(0, &fleet, &FleetService::runScanCycle);
				} else if (command == QLatin1String("ping")) {
						if (args.size() < 2) {
								qCritical() << "[main] usage: ping <name>";
								SystemLogger::shutdown();
								return 1;
						}
						fleet.ping(args.at(1), [&exitCode](const ScanResult& r) {
								printJson(JsonViews::toJson(r));
								exitCode = r.online ? 0 : 3;
								QCoreApplication::quit();
						});
				} else if (command == QLatin1String("discover")) {
						QObject::connect(&fleet, &FleetService::discoveryFinished, &app,
										 [&exitCode](const DiscoveryReport& r) {
								QJsonObject o;
								o["boards"]          = JsonViews::toJsonArray(r.devices);
								o["auto_registered"] = QJsonArray::fromStringList(r.autoRegistered);
								if (r.registrySaveFailed) o["registry_save_failed"] = true;
								printJson(o);
								exitCode = r.registrySaveFailed ? 2 : 0;
								QCoreApplication::quit();
						});
						const bool autoRegister = parser.isSet(autoRegisterOpt);
						QTimer::singleShot(0, &fleet, [&fleet, autoRegister] { fleet.runDiscovery(autoRegister); });
				} else if (command == QLatin1String("flash")) {
						if (args.size() < 3) {
								qCritical() << "[main] usage: flash <name> <firmware.bin> [--stream]";
								SystemLogger::shutdown();
								return 1;
						}
						QObject::connect(&fleet, &FleetService::flashFinished, &app,
										 [&fleet, &exitCode](const QString& id, bool ok) {
								if (const std::optional<Operation> op = fleet.operation(id))
										printJson(JsonViews::toJson(*op));
								exitCode = ok ? 0 : 4;
								QCoreApplication::quit();
						});
						QString error;
						const QString opId = fleet.startFlash(args.at(1), args.at(2), parser.isSet(streamOpt), &error);
						if (opId.isEmpty()) {
								printJson(QJsonObject{ {"success", false}, {"message", error} });
								SystemLogger::shutdown();
								return 1;
						}
				} else if (command == QLatin1String("daemon")) {
						QObject::connect(&fleet, &FleetService::scanCycleFinished, &app, [](const ScanCycleReport& r) {
								if (r.skipped) return;
								if (!r.logFailures.isEmpty())
										LOG_WARN(QString("status log failures: %1").arg(r.logFailures.join(", ")));
						});
						fleet.startPolling();
				} else {
						qCritical() << "[main] unknown command:" << command;
						SystemLogger::shutdown();
						return 1;
				}

				const int rc = app.exec();
				return rc != 0 ? rc : exitCode;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		} catch (...) {
				qCritical() << "[" << __func__ << "] Unknown fatal exception!";
		}

		return -1;
}
