/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

/*
    Termquay

    A C++/Qt library for adapting Redland RDF stores to an RDF term model.
    Copyright 2009-2016 Chris Cannam.
  
    Permission is hereby granted, free of charge, to any person
    obtaining a copy of this software and associated documentation
    files (the "Software"), to deal in the Software without
    restriction, including without limitation the rights to use, copy,
    modify, merge, publish, distribute, sublicense, and/or sell copies
    of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be
    included in all copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
    MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR
    ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
    CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
    WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

    Except as contained in this notice, the name of Chris Cannam
    shall not be used in advertising or otherwise to promote the sale,
    use or other dealings in this Software without prior written
    authorization.
*/

#include "BasicStore.h"
#include "StreamSink.h"
#include "RDFException.h"

#include <redland.h>

#include <QMutex>
#include <QMutexLocker>

#include "Debug.h"

#include <cstdlib>
#include <iostream>

namespace Termquay
{

static const char *xsdStringUri = "http://www.w3.org/2001/XMLSchema#string";

class BasicStore::D
{
public:
    D() : m_storage(0), m_model(0) {
        clear();
    }

    ~D() {
        QMutexLocker locker(&m_librdfLock);
        if (m_model) librdf_free_model(m_model);
        if (m_storage) librdf_free_storage(m_storage);
    }

    void clear() {
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::clear";
        if (m_model) librdf_free_model(m_model);
        if (m_storage) librdf_free_storage(m_storage);
        m_model = 0;
        m_storage = librdf_new_storage(m_w.getWorld(), "trees", 0, 0);
        if (!m_storage) {
            DEBUG << "Failed to create RDF trees storage, falling back to default storage type";
            m_storage = librdf_new_storage(m_w.getWorld(), 0, 0, 0);
            if (!m_storage) throw RDFInternalError("Failed to create RDF data storage");
        }
        m_model = librdf_new_model(m_w.getWorld(), m_storage, 0);
        if (!m_model) throw RDFInternalError("Failed to create RDF data model");
    }

    bool add(Triple t) {
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::add: " << t;
        return doAdd(t);
    }

    bool remove(Triple t) {
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::remove: " << t;
        if (isWildcard(t.a) || isWildcard(t.b) || isWildcard(t.c)) {
            Triples tt = doMatch(t);
            if (tt.empty()) return false;
            DEBUG << "BasicStore::remove: Removing " << tt.size() << " triple(s)";
            for (int i = 0; i < tt.size(); ++i) {
                if (!doRemove(tt[i])) {
                    DEBUG << "Failed to remove matched triple in remove() with wildcards; triple was: " << tt[i];
                    throw RDFException("Failed to remove matched statement in remove() with wildcards");
                }
            }
            return true;
        } else {
            return doRemove(t);
        }
    }

    bool contains(Triple t) const {
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::contains: " << t;
        librdf_statement *statement = tripleToStatement(t);
        if (!checkComplete(statement)) {
            librdf_free_statement(statement);
            throw RDFException("Failed to test for triple (statement is incomplete)");
        }
        if (!librdf_model_contains_statement(m_model, statement)) {
            librdf_free_statement(statement);
            return false;
        } else {
            librdf_free_statement(statement);
            return true;
        }
    }

    Triples match(Triple t) const {
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::match: " << t;
        Triples result = doMatch(t);
#ifndef NDEBUG
        DEBUG << "BasicStore::match result (size " << result.size() << "):";
        for (int i = 0; i < result.size(); ++i) {
            DEBUG << i << ". " << result[i];
        }
#endif
        return result;
    }

    Triple matchFirst(Triple t) const {
        if (!isWildcard(t.a) && !isWildcard(t.b) && !isWildcard(t.c)) {
            // triple is complete: short-circuit to a single lookup
            if (contains(t)) return t;
            else return Triple();
        }
        QMutexLocker locker(&m_librdfLock);
        DEBUG << "BasicStore::matchFirst: " << t;
        Triples result = doMatch(t, true);
        if (result.empty()) return Triple();
        else return result[0];
    }

    int size() const {
        QMutexLocker locker(&m_librdfLock);
        int n = librdf_model_size(m_model);
        if (n < 0) {
            // storage cannot report its size cheaply
            n = doMatch(Triple()).size();
        }
        return n;
    }

    Node addBlankNode() {
        QMutexLocker locker(&m_librdfLock);
        librdf_node *node = librdf_new_node_from_blank_identifier(m_w.getWorld(), 0);
        if (!node) throw RDFException("Failed to create new blank node");
        Node n = lrdfNodeToNode(node);
        librdf_free_node(node);
        return n;
    }

    void streamTo(StreamSink &sink, Node graph) const {
        Triples tt;
        {
            QMutexLocker locker(&m_librdfLock);
            tt = doMatch(Triple());
        }
        DEBUG << "BasicStore::streamTo: " << tt.size() << " statement(s), graph "
              << graph;
        sink.start();
        for (int i = 0; i < tt.size(); ++i) {
            if (graph.type == Node::Nothing) {
                sink.triple(tt[i]);
            } else {
                sink.quad(Quad(graph, tt[i]));
            }
        }
        sink.finish();
    }

private:
    class World
    {
    public:
        World() {
            QMutexLocker locker(&m_mutex);
            if (!m_world) {
                m_world = librdf_new_world();
                if (!m_world) throw RDFInternalError("Failed to create RDF world");
                librdf_world_open(m_world);
            }
            ++m_refcount;
        }
        ~World() {
            QMutexLocker locker(&m_mutex);
            if (--m_refcount == 0) {
                DEBUG << "Freeing world";
                librdf_free_world(m_world);
                m_world = 0;
            }
        }

        librdf_world *getWorld() const { return m_world; }

    private:
        static QMutex m_mutex;
        static librdf_world *m_world;
        static int m_refcount;
    };

    World m_w;
    librdf_storage *m_storage;
    librdf_model *m_model;
    static QMutex m_librdfLock; // assume the worst

    static bool isWildcard(const Node &n) {
        return (n.type == Node::Nothing || n.type == Node::Variable);
    }

    bool doAdd(Triple t) {
        librdf_statement *statement = tripleToStatement(t);
        if (!checkComplete(statement)) {
            librdf_free_statement(statement);
            throw RDFException("Failed to add triple (statement is incomplete)");
        }
        if (librdf_model_contains_statement(m_model, statement)) {
            librdf_free_statement(statement);
            return false;
        }
        if (librdf_model_add_statement(m_model, statement)) {
            librdf_free_statement(statement);
            throw RDFException("Failed to add statement to model");
        }
        librdf_free_statement(statement);
        return true;
    }

    bool doRemove(Triple t) {
        librdf_statement *statement = tripleToStatement(t);
        if (!checkComplete(statement)) {
            librdf_free_statement(statement);
            throw RDFException("Failed to remove triple (statement is incomplete)");
        }
        // Looks like librdf_model_remove_statement returns the wrong
        // value in trees storage as of 1.0.9, so let's do this check
        // separately and ignore its return value
        if (!librdf_model_contains_statement(m_model, statement)) {
            librdf_free_statement(statement);
            return false;
        }
        librdf_model_remove_statement(m_model, statement);
        librdf_free_statement(statement);
        return true;
    }

    QString uriToString(librdf_uri *u) const {
        const char *s = (const char *)librdf_uri_as_string(u);
        if (s) return QString::fromUtf8(s);
        else return "";
    }

    librdf_node *nodeToLrdfNode(Node v) const { // called with m_librdfLock held
        librdf_node *node = 0;
        switch (v.type) {
        case Node::Nothing:
        case Node::Variable:
            return 0;
        case Node::Blank: {
            QByteArray b = v.value.toUtf8();
            const unsigned char *bident = (const unsigned char *)b.data();
            node = librdf_new_node_from_blank_identifier(m_w.getWorld(), bident);
            if (!node) throw RDFException
                           ("Failed to construct node from blank identifier",
                            v.value);
        }
            break;
        case Node::URI: {
            QByteArray b = v.value.toUtf8();
            node = librdf_new_node_from_uri_string
                (m_w.getWorld(), (const unsigned char *)b.data());
            if (!node) throw RDFException("Failed to construct node from URI", v.value);
        }
            break;
        case Node::Literal: {
            QByteArray b = v.value.toUtf8();
            const unsigned char *literal = (const unsigned char *)b.data();
            if (v.language != "") {
                QByteArray lb = v.language.toUtf8();
                node = librdf_new_node_from_literal
                    (m_w.getWorld(), literal, lb.data(), 0);
                if (!node) throw RDFException
                               ("Failed to construct node from language literal");
            } else if (v.datatype != "" && v.datatype != xsdStringUri) {
                // xsd:string is stored as a plain literal
                QByteArray db = v.datatype.toUtf8();
                librdf_uri *type_uri = librdf_new_uri
                    (m_w.getWorld(), (const unsigned char *)db.data());
                if (!type_uri) throw RDFException
                                   ("Failed to construct URI from datatype string",
                                    v.datatype);
                node = librdf_new_node_from_typed_literal
                    (m_w.getWorld(), literal, 0, type_uri);
                librdf_free_uri(type_uri);
                if (!node) throw RDFException
                               ("Failed to construct node from typed literal");
            } else {
                node = librdf_new_node_from_literal
                    (m_w.getWorld(), literal, 0, 0);
                if (!node) throw RDFException
                               ("Failed to construct node from literal");
            }
        }
            break;
        }
        return node;
    }

    Node lrdfNodeToNode(librdf_node *node) const {

        Node v;
        if (!node) return v;

        if (librdf_node_is_resource(node)) {

            v.type = Node::URI;
            librdf_uri *uri = librdf_node_get_uri(node);
            v.value = uriToString(uri);

        } else if (librdf_node_is_literal(node)) {

            v.type = Node::Literal;
            const char *s = (const char *)librdf_node_get_literal_value(node);
            if (s) v.value = QString::fromUtf8(s);
            const char *lang = librdf_node_get_literal_value_language(node);
            if (lang) v.language = QString::fromUtf8(lang);
            librdf_uri *type_uri = librdf_node_get_literal_value_datatype_uri(node);
            if (type_uri) v.datatype = uriToString(type_uri);

        } else if (librdf_node_is_blank(node)) {

            v.type = Node::Blank;
            const char *s = (const char *)librdf_node_get_blank_identifier(node);
            if (s) v.value = QString::fromUtf8(s);
        }

        return v;
    }

    librdf_statement *tripleToStatement(Triple t) const {
        librdf_node *na = nodeToLrdfNode(t.a);
        librdf_node *nb = 0;
        librdf_node *nc = 0;
        try {
            nb = nodeToLrdfNode(t.b);
            nc = nodeToLrdfNode(t.c);
        } catch (RDFException &) {
            if (na) librdf_free_node(na);
            if (nb) librdf_free_node(nb);
            throw;
        }
        // the statement owns the nodes from here on
        librdf_statement *statement =
            librdf_new_statement_from_nodes(m_w.getWorld(), na, nb, nc);
        if (!statement) throw RDFException("Failed to construct statement");
        return statement;
    }

    Triple statementToTriple(librdf_statement *statement) const {
        librdf_node *subject = librdf_statement_get_subject(statement);
        librdf_node *predicate = librdf_statement_get_predicate(statement);
        librdf_node *object = librdf_statement_get_object(statement);
        Triple triple(lrdfNodeToNode(subject),
                      lrdfNodeToNode(predicate),
                      lrdfNodeToNode(object));
        return triple;
    }

    bool checkComplete(librdf_statement *statement) const {
        if (librdf_statement_is_complete(statement)) return true;
        else {
            unsigned char *text = librdf_statement_to_string(statement);
            QString str = QString::fromUtf8((char *)text);
            std::cerr << "BasicStore::checkComplete: WARNING: RDF statement is incomplete: " << str.toStdString() << std::endl;
            free(text);
            return false;
        }
    }

    Triples doMatch(Triple t, bool single = false) const {
        // Any of a, b, and c in t that have Nothing or Variable as
        // their node type will contribute all matching nodes to the
        // returned triples
        Triples results;
        librdf_statement *templ = tripleToStatement(t);
        librdf_stream *stream = librdf_model_find_statements(m_model, templ);
        librdf_free_statement(templ);
        if (!stream) throw RDFException("Failed to match RDF triples");
        while (!librdf_stream_end(stream)) {
            librdf_statement *current = librdf_stream_get_object(stream);
            if (current) results.push_back(statementToTriple(current));
            if (single) break;
            librdf_stream_next(stream);
        }
        librdf_free_stream(stream);
        return results;
    }
};

QMutex
BasicStore::D::m_librdfLock;

QMutex
BasicStore::D::World::m_mutex;

librdf_world *
BasicStore::D::World::m_world = 0;

int
BasicStore::D::World::m_refcount = 0;

BasicStore::BasicStore() :
    m_d(new D())
{
}

BasicStore::~BasicStore()
{
    delete m_d;
}

bool
BasicStore::add(Triple t)
{
    return m_d->add(t);
}

bool
BasicStore::remove(Triple t)
{
    return m_d->remove(t);
}

bool
BasicStore::contains(Triple t) const
{
    return m_d->contains(t);
}

Triples
BasicStore::match(Triple t) const
{
    return m_d->match(t);
}

Triple
BasicStore::matchFirst(Triple t) const
{
    return m_d->matchFirst(t);
}

int
BasicStore::size() const
{
    return m_d->size();
}

void
BasicStore::clear()
{
    m_d->clear();
}

Node
BasicStore::addBlankNode()
{
    return m_d->addBlankNode();
}

void
BasicStore::streamTo(StreamSink &sink, Node graph) const
{
    m_d->streamTo(sink, graph);
}

}
