#include "GuiLogging.hpp"

Q_LOGGING_CATEGORY(lcGui, "deckwarden.gui")
