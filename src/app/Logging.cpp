#include "Logging.h"

Q_LOGGING_CATEGORY(lcExport, "reelforge.export", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "reelforge.render", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProcess, "reelforge.process", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProbe, "reelforge.probe", QtInfoMsg)
