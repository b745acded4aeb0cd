#ifndef SRC_UI_GUI_VIEWS_LOGINVIEW_HPP
#define SRC_UI_GUI_VIEWS_LOGINVIEW_HPP

#include "deckwarden/core/SessionOrchestrator.hpp"
#include <QCheckBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QString>
#include <QWidget>

class LoginView : public QWidget
{
    Q_OBJECT
public:
    explicit LoginView(deckwarden::core::SessionOrchestrator& orchestrator, QWidget* parent = nullptr);

    // Re-reads status, busy state and the form contents owned by the orchestrator.
    void syncState();

signals:
    void commandFinished(bool succeeded, const QString& error);

private slots:
    void onLoginClicked();
    void onUnlockClicked();
    void onRefreshClicked();
    void onRememberEmailToggled(bool checked);
    void togglePasswordVisibility();

private: // NOLINT(readability-redundant-access-specifiers)
    void setupUi();
    void pushFormFields();
    void pullFormFields();
    void reportCompletion(const deckwarden::core::CommandReport& report);
    void reportAdmission(deckwarden::core::Admission admission);

    deckwarden::core::SessionOrchestrator& m_orchestrator;

    QLabel* m_statusLabel{ nullptr };
    QLabel* m_errorLabel{ nullptr };
    QLineEdit* m_emailInput{ nullptr };
    QLineEdit* m_passInput{ nullptr };
    QLineEdit* m_totpInput{ nullptr };
    QPushButton* m_visibilityBtn{ nullptr };
    QCheckBox* m_euServer{ nullptr };
    QCheckBox* m_rememberEmail{ nullptr };
    QPushButton* m_loginBtn{ nullptr };
    QPushButton* m_unlockBtn{ nullptr };
    QPushButton* m_refreshBtn{ nullptr };
};

#endif // SRC_UI_GUI_VIEWS_LOGINVIEW_HPP
