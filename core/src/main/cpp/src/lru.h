/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>

namespace dictstore {

    /**
     * Generic Node for LRU Caching
     */
    template< typename CachedObjectType, typename IdType >
    struct LRUCacheNode {

        typedef LRUCacheNode<CachedObjectType, IdType> _SelfType;

        LRUCacheNode(const IdType &i, CachedObjectType o)
                : id(i), object(std::move(o)), next(nullptr), prev(nullptr) {}

        IdType id;
        CachedObjectType object;

        // linked list of cache nodes, _first is the most recently used
        _SelfType *next;
        _SelfType *prev;
    };

    /**
     * Least recently used cache of values keyed by id.
     *
     * Not thread safe; owners serialize access. get() promotes to most
     * recently used. Capacity is enforced by the owner through removeOne().
     */
    template< typename CachedObjectType, typename IdType >
    class LRUCache {
    public:
        typedef size_t sizeType;
        typedef LRUCacheNode<CachedObjectType, IdType> Node;

        LRUCache() : _first(nullptr), _last(nullptr) {}

        ~LRUCache() { clear(); }

        LRUCache(const LRUCache&) = delete;
        LRUCache& operator=(const LRUCache&) = delete;

        sizeType size() const { return _nodes.size(); }
        bool empty() const { return _nodes.empty(); }

        /**
         * Gets an item by id and marks it most recently used
         */
        CachedObjectType* get(const IdType &id) {
            auto it = _nodes.find(id);
            if (it == _nodes.end())
                return nullptr;
            Node* n = it->second;
            unlink(n);
            pushFront(n);
            return &n->object;
        }

        /**
         * adds an item as most recently used; returns nullptr and leaves
         * the cache untouched if id is already present
         */
        Node* add(const IdType &id, CachedObjectType object) {
            if (_nodes.find(id) != _nodes.end())
                return nullptr;
            Node* n = new Node(id, std::move(object));
            _nodes.emplace(id, n);
            pushFront(n);
            return n;
        }

        /**
         * removes the least recently used node, false if empty
         */
        bool removeOne() {
            if (!_last)
                return false;
            Node* victim = _last;
            unlink(victim);
            _nodes.erase(victim->id);
            delete victim;
            return true;
        }

        void clear() {
            Node* n = _first;
            while (n) {
                Node* next = n->next;
                delete n;
                n = next;
            }
            _nodes.clear();
            _first = nullptr;
            _last = nullptr;
        }

     private:
        void unlink(Node* n) {
            if (n->prev) n->prev->next = n->next;
            else _first = n->next;
            if (n->next) n->next->prev = n->prev;
            else _last = n->prev;
            n->next = n->prev = nullptr;
        }

        void pushFront(Node* n) {
            n->prev = nullptr;
            n->next = _first;
            if (_first) _first->prev = n;
            _first = n;
            if (!_last) _last = n;
        }

        // facilitate easy lookup by ID
        std::unordered_map<IdType, Node*> _nodes;

        // facilitate order by LRU
        Node* _first;
        Node* _last;
     };

}
