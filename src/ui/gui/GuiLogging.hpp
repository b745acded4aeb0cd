#ifndef DECKWARDEN_GUI_LOGGING_HPP
#define DECKWARDEN_GUI_LOGGING_HPP

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcGui)

#endif // DECKWARDEN_GUI_LOGGING_HPP
