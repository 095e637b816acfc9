#include "LaunchStrategy.h"
#include "CdpSession.h"
#include "Log.h"

#include <QDir>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStandardPaths>

namespace {

const QStringList BrowserNames = {
    "chromium",
    "chromium-browser",
    "google-chrome",
    "google-chrome-stable",
};

const QStringList WellKnownPaths = {
    "/usr/bin/chromium",
    "/usr/bin/chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/snap/bin/chromium",
    "/opt/google/chrome/chrome",
    "/Applications/Chromium.app/Contents/MacOS/Chromium",
    "/Applications/Google Chrome.app/Contents/MacOS/Google Chrome",
};

QStringList headlessArguments(const BrowserEnvironment& env) {
    return {
        "--headless=new",
        QString("--window-size=%1,%2").arg(env.width).arg(env.height),
        "--hide-scrollbars",
        "--mute-audio",
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-extensions",
        "--disable-background-timer-throttling",
        "--disable-backgrounding-occluded-windows",
        "--disable-renderer-backgrounding",
    };
}

std::unique_ptr<BrowserSession> launchProcess(const QString& program, const QStringList& args,
                                              int timeoutMs, QString* error) {
    auto session = std::make_unique<CdpSession>();
    if (!session->launch(program, args, timeoutMs)) {
        if (error) *error = session->errorString();
        return nullptr;
    }
    return session;
}

} // namespace

QStringList BrowserEnvironment::systemSearchPaths() {
    const QString path = QProcessEnvironment::systemEnvironment().value("PATH");
    return path.split(QDir::listSeparator(), Qt::SkipEmptyParts);
}

// --- RemoteEndpointStrategy ---

bool RemoteEndpointStrategy::isApplicable(const BrowserEnvironment& env) const {
    return !env.endpoint.isEmpty();
}

std::unique_ptr<BrowserSession> RemoteEndpointStrategy::launch(const BrowserEnvironment& env,
                                                               QString* error) {
    auto session = std::make_unique<CdpSession>();
    if (!session->connectToBrowser(env.endpoint, env.launchTimeoutMs)) {
        if (error) *error = session->errorString();
        return nullptr;
    }
    return session;
}

// --- ExecutablePathStrategy ---

bool ExecutablePathStrategy::isApplicable(const BrowserEnvironment& env) const {
    return !env.executablePath.isEmpty();
}

QStringList ExecutablePathStrategy::arguments(const BrowserEnvironment& env) {
    QStringList args = headlessArguments(env);
    args << "--no-sandbox"
         << "--disable-setuid-sandbox"
         << "--disable-dev-shm-usage"
         << "--disable-gpu"
         << "--disable-software-rasterizer"
         << "--single-process"
         << "--no-zygote";
    return args;
}

std::unique_ptr<BrowserSession> ExecutablePathStrategy::launch(const BrowserEnvironment& env,
                                                               QString* error) {
    QFileInfo info(env.executablePath);
    if (!info.isFile() || !info.isExecutable()) {
        if (error) *error = QString("%1 is not an executable file").arg(env.executablePath);
        return nullptr;
    }
    return launchProcess(env.executablePath, arguments(env), env.launchTimeoutMs, error);
}

// --- SystemBrowserStrategy ---

QString SystemBrowserStrategy::locate(const BrowserEnvironment& env) {
    for (const QString& name : BrowserNames) {
        const QString found = env.searchPaths.isEmpty()
            ? QStandardPaths::findExecutable(name)
            : QStandardPaths::findExecutable(name, env.searchPaths);
        if (!found.isEmpty()) return found;
    }
    for (const QString& path : WellKnownPaths) {
        QFileInfo info(path);
        if (info.isFile() && info.isExecutable()) return path;
    }
    return QString();
}

bool SystemBrowserStrategy::isApplicable(const BrowserEnvironment& env) const {
    return !locate(env).isEmpty();
}

QStringList SystemBrowserStrategy::arguments(const BrowserEnvironment& env) {
    QStringList args = headlessArguments(env);
    args << "--no-sandbox"
         << "--disable-setuid-sandbox"
         << "--disable-dev-shm-usage"
         << "--disable-gpu";
    return args;
}

std::unique_ptr<BrowserSession> SystemBrowserStrategy::launch(const BrowserEnvironment& env,
                                                              QString* error) {
    const QString program = locate(env);
    if (program.isEmpty()) {
        if (error) *error = "no Chromium or Chrome installation found";
        return nullptr;
    }
    return launchProcess(program, arguments(env), env.launchTimeoutMs, error);
}

// --- BrowserLauncher ---

BrowserLauncher::BrowserLauncher(const BrowserEnvironment& env) : m_env(env) {}

BrowserLauncher::~BrowserLauncher() = default;

std::unique_ptr<BrowserLauncher> BrowserLauncher::withDefaultStrategies(const BrowserEnvironment& env) {
    auto launcher = std::make_unique<BrowserLauncher>(env);
    launcher->addStrategy(std::make_unique<RemoteEndpointStrategy>());
    launcher->addStrategy(std::make_unique<ExecutablePathStrategy>());
    launcher->addStrategy(std::make_unique<SystemBrowserStrategy>());
    return launcher;
}

void BrowserLauncher::addStrategy(std::unique_ptr<LaunchStrategy> strategy) {
    m_strategies.push_back(std::move(strategy));
}

std::unique_ptr<BrowserSession> BrowserLauncher::launch() {
    m_failures.clear();
    m_error.clear();

    for (const auto& strategy : m_strategies) {
        if (!strategy->isApplicable(m_env)) {
            qCDebug(lcCapture) << "Launch strategy" << strategy->name() << "not applicable";
            continue;
        }

        qCInfo(lcCapture) << "Obtaining browser via" << strategy->name();
        QString reason;
        std::unique_ptr<BrowserSession> session = strategy->launch(m_env, &reason);
        if (session) {
            return session;
        }

        if (reason.isEmpty()) reason = "unknown error";
        qCWarning(lcCapture) << "Launch strategy" << strategy->name() << "failed:" << reason;
        m_failures.append(QString("%1: %2").arg(strategy->name(), reason));
    }

    if (m_failures.isEmpty()) {
        m_error = "No browser available: configure a browser endpoint or executable, "
                  "or install Chromium";
    } else {
        m_error = QString("Browser launch failed (%1)").arg(m_failures.join("; "));
    }
    return nullptr;
}
