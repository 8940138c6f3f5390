#include "HealthPoller.hpp"
#include "SidecarError.hpp"
#include "SandcastleLogging.hpp"
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

HealthPoller::HealthPoller(HealthPolicy policy, QObject* parent)
    : QObject(parent)
    , m_policy(std::move(policy))
    , m_network(new QNetworkAccessManager(this))
{
    // Loopback only; a system proxy must not see the probe.
    m_network->setProxy(QNetworkProxy::NoProxy);
}

HealthPoller::~HealthPoller() {
    if (m_promise) {
        m_promise->setException(SidecarError(SidecarErrorKind::HealthCheckFailed,
                                             QStringLiteral("Health check abandoned")));
        m_promise->finish();
    }
}

QFuture<int> HealthPoller::poll(Port port) {
    if (m_promise)
        return m_promise->future();

    m_url = QUrl(QStringLiteral("http://%1:%2%3").arg(m_policy.host).arg(port).arg(m_policy.path));
    m_attempt = 0;
    m_promise = std::make_unique<QPromise<int>>();
    m_promise->start();
    QFuture<int> future = m_promise->future();

    sLog_Sidecar("Polling" << m_url.toString() << "up to" << m_policy.maxAttempts << "times");
    probe();
    return future;
}

void HealthPoller::probe() {
    ++m_attempt;
    QNetworkRequest request(m_url);
    request.setTransferTimeout(m_policy.requestTimeoutMs);
    // A redirect is a failed probe, not a hop to some other endpoint.
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    QNetworkReply* reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply]{ onReply(reply); });
}

void HealthPoller::onReply(QNetworkReply* reply) {
    reply->deleteLater();
    if (!m_promise)
        return;

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const int status = statusAttr.isValid() ? statusAttr.toInt() : 0;

    if (status >= 200 && status < 300) {
        sLog_Sidecar("Server ready after" << m_attempt << "attempts");
        auto promise = std::move(m_promise);
        promise->addResult(m_attempt);
        promise->finish();
        emit ready(m_attempt);
        return;
    }

    retryOrFail(status != 0 ? QStringLiteral("HTTP %1").arg(status) : reply->errorString());
}

void HealthPoller::retryOrFail(const QString& reason) {
    sLog_DebugN(1, "Health probe" << m_attempt << "failed:" << reason);
    emit probeFailed(m_attempt, reason);

    if (m_attempt >= m_policy.maxAttempts) {
        auto promise = std::move(m_promise);
        promise->setException(SidecarError(
            SidecarErrorKind::HealthCheckFailed,
            QStringLiteral("Server failed to respond to health check within %1ms").arg(m_policy.budgetMs())));
        promise->finish();
        return;
    }

    QTimer::singleShot(m_policy.retryIntervalMs, this, [this]{
        if (m_promise)
            probe();
    });
}
