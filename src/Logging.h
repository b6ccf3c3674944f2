#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcJob)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

// Installs the message pattern used by the application.
void installMessagePattern();
