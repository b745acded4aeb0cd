#ifndef DECKWARDEN_SETTINGS_DIALOG_HPP
#define DECKWARDEN_SETTINGS_DIALOG_HPP

#include "deckwarden/core/SessionOrchestrator.hpp"
#include <QCheckBox>
#include <QDialog>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>
#include <QString>

class SettingsDialog final : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(deckwarden::core::SessionOrchestrator& orchestrator, QWidget* parent = nullptr);

    void setCliProgram(const QString& program);
    void setCliTimeoutMs(int ms);
    void setClipboardTimeoutMs(int ms);

    // Re-reads the saved-password flag; call before showing the dialog.
    void syncRememberPassword();

    [[nodiscard]] QString cliProgram() const;
    [[nodiscard]] int cliTimeoutMs() const noexcept;
    [[nodiscard]] int clipboardTimeoutMs() const noexcept;

private slots:
    void onRememberToggled(bool checked);
    void onSavePasswordClicked();
    void onSaveClicked();

private:
    void setupUi();
    void clearPasswordField();

    deckwarden::core::SessionOrchestrator& m_orchestrator;

    QLineEdit* m_cliProgram{ nullptr };
    QSpinBox* m_cliTimeoutSeconds{ nullptr };
    QSpinBox* m_clipboardSeconds{ nullptr };
    QCheckBox* m_rememberPassword{ nullptr };
    QLineEdit* m_password{ nullptr };
    QPushButton* m_savePasswordButton{ nullptr };
    QLabel* m_passwordStatus{ nullptr };
    QPushButton* m_saveButton{ nullptr };
    QPushButton* m_cancelButton{ nullptr };
};

#endif // DECKWARDEN_SETTINGS_DIALOG_HPP
