#pragma once

#include <QString>
#include <QStringList>
#include <memory>
#include <vector>
#include "AppConstants.h"
#include "BrowserSession.h"

// Where and how a browser may be obtained on this machine.
struct BrowserEnvironment {
    QString endpoint;           // running browser (ws:// or http:// DevTools)
    QString executablePath;     // explicitly configured Chromium binary
    QStringList searchPaths;    // directories searched for system browsers
    int width = AppConstants::FrameWidth;
    int height = AppConstants::FrameHeight;
    int launchTimeoutMs = 30000;

    // searchPaths taken from PATH.
    static QStringList systemSearchPaths();
};

// One way of obtaining a browser session.
class LaunchStrategy {
public:
    virtual ~LaunchStrategy() = default;

    virtual QString name() const = 0;
    virtual bool isApplicable(const BrowserEnvironment& env) const = 0;
    virtual std::unique_ptr<BrowserSession> launch(const BrowserEnvironment& env, QString* error) = 0;
};

class RemoteEndpointStrategy : public LaunchStrategy {
public:
    QString name() const override { return "remote-endpoint"; }
    bool isApplicable(const BrowserEnvironment& env) const override;
    std::unique_ptr<BrowserSession> launch(const BrowserEnvironment& env, QString* error) override;
};

// Configured binary, typically inside a container image.
class ExecutablePathStrategy : public LaunchStrategy {
public:
    QString name() const override { return "executable-path"; }
    bool isApplicable(const BrowserEnvironment& env) const override;
    std::unique_ptr<BrowserSession> launch(const BrowserEnvironment& env, QString* error) override;

    static QStringList arguments(const BrowserEnvironment& env);
};

// Chromium or Chrome found on PATH or in a well-known install location.
class SystemBrowserStrategy : public LaunchStrategy {
public:
    QString name() const override { return "system-browser"; }
    bool isApplicable(const BrowserEnvironment& env) const override;
    std::unique_ptr<BrowserSession> launch(const BrowserEnvironment& env, QString* error) override;

    static QString locate(const BrowserEnvironment& env);
    static QStringList arguments(const BrowserEnvironment& env);
};

// Tries its strategies in order; the first session obtained wins.
class BrowserLauncher {
public:
    explicit BrowserLauncher(const BrowserEnvironment& env);
    ~BrowserLauncher();

    // Remote endpoint, configured executable, then system browser.
    static std::unique_ptr<BrowserLauncher> withDefaultStrategies(const BrowserEnvironment& env);

    void addStrategy(std::unique_ptr<LaunchStrategy> strategy);
    const std::vector<std::unique_ptr<LaunchStrategy>>& strategies() const { return m_strategies; }
    const BrowserEnvironment& environment() const { return m_env; }

    // nullptr when every applicable strategy failed; see failures().
    std::unique_ptr<BrowserSession> launch();

    // "<strategy>: <reason>" for each attempt of the last launch().
    const QStringList& failures() const { return m_failures; }
    QString errorString() const { return m_error; }

private:
    BrowserEnvironment m_env;
    std::vector<std::unique_ptr<LaunchStrategy>> m_strategies;
    QStringList m_failures;
    QString m_error;
};
