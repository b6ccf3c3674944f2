#include "Logging.h"

Q_LOGGING_CATEGORY(lcJob, "silencecut.job")
Q_LOGGING_CATEGORY(lcUi, "silencecut.ui")

void installMessagePattern() {
    qSetMessagePattern(
            "%{time hh:mm:ss.zzz} %{category} "
            "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
            "%{if-critical}C%{endif}%{if-fatal}F%{endif}: %{message}");
}
