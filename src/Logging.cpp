#include "courseplan/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "courseplan.parser", QtWarningMsg)
Q_LOGGING_CATEGORY(lcLoader, "courseplan.loader", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCsv, "courseplan.csv", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSelection, "courseplan.selection", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSettings, "courseplan.settings", QtInfoMsg)
