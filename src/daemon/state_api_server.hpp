#pragma once

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include "engine/request_handler.hpp"

namespace hoststate {

/**
 * StateApiServer serves the JSON request format of RequestHandler over a
 * local UNIX socket. One request per connection: the client writes a JSON
 * object, the server answers with one JSON object and disconnects.
 *
 * A request may arrive over several reads; bytes are buffered per connection
 * until they form a complete JSON value or turn out to be malformed.
 */
class StateApiServer : public QObject
{
    Q_OBJECT
public:
    StateApiServer(RequestHandler &handler, QString socketPath, QObject *parent = nullptr);
    ~StateApiServer() override;

    bool start();

    QString socketPath() const
    {
        return m_socketPath;
    }

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void respond(QLocalSocket *socket, const QByteArray &response);

    RequestHandler &m_handler;
    QString m_socketPath;
    QLocalServer m_server;
    QHash<QLocalSocket *, QByteArray> m_pending;
};

} // namespace hoststate
